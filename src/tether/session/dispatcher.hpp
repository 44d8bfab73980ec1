#pragma once

#include "envelope.hpp"
#include "invocation-target.hpp"

#include <optional>

namespace tether::session {

/**
 * @brief What becomes of an exception thrown by a target.
 */
enum class FailurePolicy : int {
  RESPECT_TARGET, //!< Failure response iff `Invokable::reports_failures()`, else escalate
  ALWAYS_RESPOND, //!< Always a failure response
  ALWAYS_ESCALATE //!< Always `ecode::invocation_failure`
};

constexpr std::string_view str(FailurePolicy policy) {
  switch (policy) {
  case FailurePolicy::RESPECT_TARGET: return "respect-target";
  case FailurePolicy::ALWAYS_RESPOND: return "always-respond";
  case FailurePolicy::ALWAYS_ESCALATE: return "always-escalate";
  }
  return "<unknown case>";
}

std::optional<FailurePolicy> parse_failure_policy(std::string_view value);

/**
 * @brief Turns one request into one response, by way of the target.
 *
 * The target is resolved afresh for every call. Failing to resolve always escalates
 * (`ecode::invocation_failure`); a target that throws is handled per the `FailurePolicy`.
 * No I/O of its own.
 */
class Dispatcher {
private:
  shared_ptr<TargetResolver> resolver_;
  FailurePolicy policy_ = FailurePolicy::RESPECT_TARGET;

public:
  explicit Dispatcher(shared_ptr<TargetResolver> resolver,
                      FailurePolicy policy = FailurePolicy::RESPECT_TARGET);

  FailurePolicy policy() const { return policy_; }

  expected<ResponseEnvelope, error_code> invoke(const RequestEnvelope& request,
                                                std::string_view target_id) const;
};

} // namespace tether::session
