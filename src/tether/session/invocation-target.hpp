#pragma once

#include "tether/utils.hpp"

#include <map>
#include <mutex>
#include <string>
#include <string_view>

/**
 * @defgroup invocation Invocation Targets
 * @ingroup tether
 *
 * The local code that answers requests. A `TargetResolver` maps the configured target id
 * to an `Invokable`, afresh for every request, so a target that is rebuilt between
 * requests is picked up without restarting the session.
 */

namespace tether::session {

// -------------------------------------------------------------------------------------- Invokable

class Invokable {
public:
  virtual ~Invokable() = default;

  /**
   * @brief Answer one request payload with one response payload.
   * Throws (any `std::exception`) on application failure.
   */
  virtual string call(std::string_view request_payload) = 0;

  /**
   * @brief True if the target's failures are meant to reach the relay as failure responses.
   */
  virtual bool reports_failures() const { return true; }
};

// --------------------------------------------------------------------------------- TargetResolver

class TargetResolver {
public:
  virtual ~TargetResolver() = default;

  /**
   * @return nullptr if nothing is registered under `id`. May also throw.
   */
  virtual shared_ptr<Invokable> resolve(std::string_view id) = 0;
};

// --------------------------------------------------------------------------------- FunctionTarget

class FunctionTarget final : public Invokable {
private:
  any_invocable<string(std::string_view)> function_;
  bool reports_failures_ = true;

public:
  explicit FunctionTarget(any_invocable<string(std::string_view)> function,
                          bool reports_failures = true)
      : function_{std::move(function)}, reports_failures_{reports_failures} {}

  string call(std::string_view request_payload) override { return function_(request_payload); }
  bool reports_failures() const override { return reports_failures_; }
};

// ------------------------------------------------------------------------------------- EchoTarget

/**
 * @brief Answers every request with its own payload. For checking a relay end to end.
 */
class EchoTarget final : public Invokable {
public:
  string call(std::string_view request_payload) override { return string{request_payload}; }
};

// --------------------------------------------------------------------------------- TargetRegistry

/**
 * @brief In-process targets, registered by name. Thread safe.
 */
class TargetRegistry final : public TargetResolver {
public:
  using factory_type = function<shared_ptr<Invokable>()>;

private:
  mutable std::mutex padlock_;
  std::map<string, factory_type, std::less<>> factories_;

public:
  /**
   * @brief Register (or replace) the factory for `id`. Each `resolve` calls it once.
   */
  void add(string id, factory_type factory);

  /**
   * @brief Register a plain function, wrapped in a new `FunctionTarget` for each lookup.
   */
  void add_function(string id, function<string(std::string_view)> fn,
                    bool reports_failures = true);

  bool contains(std::string_view id) const;

  shared_ptr<Invokable> resolve(std::string_view id) override;
};

} // namespace tether::session
