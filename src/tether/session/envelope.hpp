#pragma once

#include "tether/utils.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace tether::session {

// Wire constants shared with the debugging relay
constexpr std::string_view k_envelope_version = "1.0";
constexpr std::string_view k_request_type = "SkillRequestMessage";
constexpr std::string_view k_success_type = "SkillResponseSuccessMessage";
constexpr std::string_view k_failure_type = "SkillResponseFailureMessage";
constexpr std::string_view k_failure_error_code = "500";

/**
 * @brief One inbound request. Lives for a single dispatch cycle.
 */
struct RequestEnvelope {
  string version = string{k_envelope_version};
  string type = string{k_request_type};
  string request_id = {};
  string request_payload = {}; //!< Opaque to the session; handed to the target as is

  bool operator==(const RequestEnvelope&) const = default;
};

struct SuccessBody {
  string response_payload = {};
  bool operator==(const SuccessBody&) const = default;
};

struct FailureBody {
  string error_code = string{k_failure_error_code};
  string error_message = {};
  bool operator==(const FailureBody&) const = default;
};

/**
 * @brief The one response written back for an accepted request.
 */
struct ResponseEnvelope {
  string version = string{k_envelope_version};
  string type = string{k_success_type};
  string original_request_id = {};
  std::variant<SuccessBody, FailureBody> body = SuccessBody{};

  bool is_success() const { return std::holds_alternative<SuccessBody>(body); }

  bool operator==(const ResponseEnvelope&) const = default;

  static ResponseEnvelope success(string request_id, string response_payload) {
    return {.type = string{k_success_type},
            .original_request_id = std::move(request_id),
            .body = SuccessBody{std::move(response_payload)}};
  }

  static ResponseEnvelope failure(string request_id, string error_message) {
    return {.type = string{k_failure_type},
            .original_request_id = std::move(request_id),
            .body = FailureBody{.error_message = std::move(error_message)}};
  }
};

} // namespace tether::session
