#include "dispatcher.hpp"

#include <stdexcept>

namespace tether::session {

std::optional<FailurePolicy> parse_failure_policy(std::string_view value) {
  for (auto policy : {FailurePolicy::RESPECT_TARGET, FailurePolicy::ALWAYS_RESPOND,
                      FailurePolicy::ALWAYS_ESCALATE})
    if (str(policy) == value)
      return policy;
  return std::nullopt;
}

Dispatcher::Dispatcher(shared_ptr<TargetResolver> resolver, FailurePolicy policy)
    : resolver_{std::move(resolver)}, policy_{policy} {
  if (resolver_ == nullptr)
    throw std::invalid_argument{"dispatcher requires a target resolver"};
}

expected<ResponseEnvelope, error_code> Dispatcher::invoke(const RequestEnvelope& request,
                                                          std::string_view target_id) const {
  const auto escalate = []() {
    return make_unexpected(make_error_code(ecode::invocation_failure));
  };

  shared_ptr<Invokable> target;
  try {
    target = resolver_->resolve(target_id);
  } catch (const std::exception& e) {
    LOG_ERR("failed to resolve target '{}': {}", target_id, e.what());
    return escalate();
  } catch (...) {
    LOG_ERR("failed to resolve target '{}': unknown exception", target_id);
    return escalate();
  }

  if (target == nullptr) {
    LOG_ERR("no target registered as '{}'", target_id);
    return escalate();
  }

  const auto on_failure =
      [&](std::string_view message) -> expected<ResponseEnvelope, error_code> {
    const bool respond = (policy_ == FailurePolicy::ALWAYS_RESPOND) ||
                         (policy_ == FailurePolicy::RESPECT_TARGET && target->reports_failures());
    if (respond) {
      WARN("target '{}' failed request {}: {}", target_id, request.request_id, message);
      return ResponseEnvelope::failure(request.request_id, string{message});
    }
    LOG_ERR("target '{}' failed request {}, escalating: {}", target_id, request.request_id,
            message);
    return escalate();
  };

  try {
    return ResponseEnvelope::success(request.request_id, target->call(request.request_payload));
  } catch (const std::exception& e) {
    return on_failure(e.what());
  } catch (...) {
    return on_failure("unknown exception");
  }
}

} // namespace tether::session
