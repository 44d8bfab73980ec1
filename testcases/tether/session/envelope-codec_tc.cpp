#include "tether/session/envelope-codec.hpp"

#include <nlohmann/json.hpp>

#include <catch2/catch.hpp>

namespace tether::session::tests {

using json = nlohmann::json;

static bool is_malformed(std::string_view text) {
  const auto request = decode_request(text);
  return !request.has_value() && request.error() == make_error_code(ecode::malformed_payload);
}

CATCH_TEST_CASE("EnvelopeCodec", "[envelope-codec]") {
  CATCH_SECTION("decode-request") {
    const auto request = decode_request(
        R"({"version":"1.0","type":"SkillRequestMessage","requestId":"r-1",)"
        R"("requestPayload":"{\"session\":{}}"})");
    CATCH_REQUIRE(request.has_value());
    CATCH_REQUIRE(request->version == "1.0");
    CATCH_REQUIRE(request->type == "SkillRequestMessage");
    CATCH_REQUIRE(request->request_id == "r-1");
    CATCH_REQUIRE(request->request_payload == R"({"session":{}})");
  }

  CATCH_SECTION("decode-request-optional-fields") {
    const auto request = decode_request(R"({"requestId":"r-2","requestPayload":"","extra":[1,2]})");
    CATCH_REQUIRE(request.has_value());
    CATCH_REQUIRE(request->version == k_envelope_version);
    CATCH_REQUIRE(request->type == k_request_type);
    CATCH_REQUIRE(request->request_id == "r-2");
    CATCH_REQUIRE(request->request_payload.empty());
  }

  CATCH_SECTION("decode-request-malformed") {
    CATCH_REQUIRE(is_malformed(""));
    CATCH_REQUIRE(is_malformed("not json"));
    CATCH_REQUIRE(is_malformed(R"({"requestId":"r-1","requestPayload":"x")")); // truncated
    CATCH_REQUIRE(is_malformed(R"(["requestId","requestPayload"])"));
    CATCH_REQUIRE(is_malformed(R"("just a string")"));
    CATCH_REQUIRE(is_malformed(R"({"requestPayload":"x"})"));
    CATCH_REQUIRE(is_malformed(R"({"requestId":"r-1"})"));
    CATCH_REQUIRE(is_malformed(R"({"requestId":7,"requestPayload":"x"})"));
    CATCH_REQUIRE(is_malformed(R"({"requestId":"r-1","requestPayload":{"a":1}})"));
    CATCH_REQUIRE(is_malformed(R"({"version":1,"requestId":"r-1","requestPayload":"x"})"));
    CATCH_REQUIRE(is_malformed("{\"requestId\":\"r-\xff\",\"requestPayload\":\"x\"}"));
  }

  CATCH_SECTION("encode-success") {
    const auto text = encode_response(ResponseEnvelope::success("r-1", R"({"ok":true})"));
    const auto document = json::parse(text);
    CATCH_REQUIRE(document.size() == 4);
    CATCH_REQUIRE(document["version"] == "1.0");
    CATCH_REQUIRE(document["type"] == "SkillResponseSuccessMessage");
    CATCH_REQUIRE(document["originalRequestId"] == "r-1");
    CATCH_REQUIRE(document["responsePayload"] == R"({"ok":true})");
  }

  CATCH_SECTION("encode-failure") {
    const auto text = encode_response(ResponseEnvelope::failure("r-9", "target exploded"));
    const auto document = json::parse(text);
    CATCH_REQUIRE(document.size() == 5);
    CATCH_REQUIRE(document["type"] == "SkillResponseFailureMessage");
    CATCH_REQUIRE(document["originalRequestId"] == "r-9");
    CATCH_REQUIRE(document["errorCode"] == "500");
    CATCH_REQUIRE(document["errorMessage"] == "target exploded");
    CATCH_REQUIRE(!document.contains("responsePayload"));
  }

  CATCH_SECTION("encode-invalid-utf8-output") {
    const auto text = encode_response(ResponseEnvelope::success("r-1", "bad \xff byte"));
    const auto document = json::parse(text, nullptr, false);
    CATCH_REQUIRE(!document.is_discarded());
    CATCH_REQUIRE(document["responsePayload"].get<string>().starts_with("bad "));
  }

  CATCH_SECTION("decode-response") {
    const auto success = ResponseEnvelope::success("r-1", "payload");
    CATCH_REQUIRE(decode_response(encode_response(success)) == success);

    const auto failure = ResponseEnvelope::failure("r-2", "nope");
    const auto decoded = decode_response(encode_response(failure));
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(!decoded->is_success());
    CATCH_REQUIRE(*decoded == failure);

    CATCH_REQUIRE(!decode_response(R"({"originalRequestId":"r-1","responsePayload":"x"})"));
    CATCH_REQUIRE(!decode_response(
        R"({"type":"SkillResponseFailureMessage","originalRequestId":"r-1","errorCode":"500"})"));
    CATCH_REQUIRE(!decode_response(R"({"type":"SkillResponseSuccessMessage","originalRequestId":"r"})"));
  }

  CATCH_SECTION("request-reencoding-is-stable") {
    const string inbound = R"({"requestPayload":"{\"a\":[1,2,\"é\"]}","requestId":"r-3",)"
                           R"("type":"SkillRequestMessage","ignored":null})";
    const auto first = decode_request(inbound);
    CATCH_REQUIRE(first.has_value());
    const auto second = decode_request(encode_request(*first));
    CATCH_REQUIRE(second.has_value());
    CATCH_REQUIRE(*second == *first);
  }

  CATCH_SECTION("frame-to-text") {
    const string bytes = {'{', '\0', '}'};
    const auto text = frame_to_text(
        std::span<const std::byte>{reinterpret_cast<const std::byte*>(bytes.data()), bytes.size()});
    CATCH_REQUIRE(text == bytes);
    CATCH_REQUIRE(frame_to_text({}).empty());
  }
}

} // namespace tether::session::tests
