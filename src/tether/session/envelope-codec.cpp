#include "envelope-codec.hpp"

#include <nlohmann/json.hpp>

namespace tether::session {

using json = nlohmann::json;

namespace {

auto malformed() { return make_unexpected(make_error_code(ecode::malformed_payload)); }

// Reads `key` into `out`. Absent is okay iff the field is optional; a non-string never is.
bool read_string(const json& object, const char* key, bool required, string& out) {
  const auto ii = object.find(key);
  if (ii == object.end())
    return !required;
  if (!ii->is_string())
    return false;
  out = ii->get<string>();
  return true;
}

json parse_object(std::string_view text) {
  // No exceptions: invalid documents are "discarded"
  auto document = json::parse(text.begin(), text.end(), nullptr, false);
  if (document.is_discarded() || !document.is_object())
    return json{};
  return document;
}

} // namespace

string frame_to_text(std::span<const std::byte> frame) {
  return string{reinterpret_cast<const char*>(frame.data()), frame.size()};
}

// ---------------------------------------------------------------------------------------- requests

expected<RequestEnvelope, error_code> decode_request(std::string_view text) {
  const auto document = parse_object(text);
  if (!document.is_object())
    return malformed();

  RequestEnvelope out;
  if (!read_string(document, "version", false, out.version) ||
      !read_string(document, "type", false, out.type) ||
      !read_string(document, "requestId", true, out.request_id) ||
      !read_string(document, "requestPayload", true, out.request_payload))
    return malformed();

  return out;
}

string encode_request(const RequestEnvelope& request) {
  return json{{"version", request.version},
              {"type", request.type},
              {"requestId", request.request_id},
              {"requestPayload", request.request_payload}}
      .dump();
}

// --------------------------------------------------------------------------------------- responses

string encode_response(const ResponseEnvelope& response) {
  json out = {{"version", response.version},
              {"type", response.type},
              {"originalRequestId", response.original_request_id}};

  if (const auto* success = std::get_if<SuccessBody>(&response.body)) {
    out["responsePayload"] = success->response_payload;
  } else {
    const auto& failure = std::get<FailureBody>(response.body);
    out["errorCode"] = failure.error_code;
    out["errorMessage"] = failure.error_message;
  }

  // Target output is not trusted to be valid UTF-8
  return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

expected<ResponseEnvelope, error_code> decode_response(std::string_view text) {
  const auto document = parse_object(text);
  if (!document.is_object())
    return malformed();

  ResponseEnvelope out;
  if (!read_string(document, "version", false, out.version) ||
      !read_string(document, "type", true, out.type) ||
      !read_string(document, "originalRequestId", true, out.original_request_id))
    return malformed();

  if (out.type == k_failure_type) {
    FailureBody failure;
    if (!read_string(document, "errorCode", true, failure.error_code) ||
        !read_string(document, "errorMessage", true, failure.error_message))
      return malformed();
    out.body = std::move(failure);
  } else {
    SuccessBody success;
    if (!read_string(document, "responsePayload", true, success.response_payload))
      return malformed();
    out.body = std::move(success);
  }

  return out;
}

} // namespace tether::session
