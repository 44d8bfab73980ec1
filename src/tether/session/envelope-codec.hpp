#pragma once

#include "envelope.hpp"

#include <span>

/**
 * JSON encoding of envelopes, one envelope per frame:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.json}
 * {"version":"1.0","type":"SkillRequestMessage","requestId":"…","requestPayload":"…"}
 * {"version":"1.0","type":"SkillResponseSuccessMessage","originalRequestId":"…",
 *  "responsePayload":"…"}
 * {"version":"1.0","type":"SkillResponseFailureMessage","originalRequestId":"…",
 *  "errorCode":"500","errorMessage":"…"}
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Decoding never returns a partial envelope: it fails with `ecode::malformed_payload`.
 */

namespace tether::session {

/**
 * @brief A binary frame's bytes, copied whole into text.
 */
string frame_to_text(std::span<const std::byte> frame);

/**
 * @brief Decode an inbound request.
 *
 * `requestId` and `requestPayload` are required strings; `version` and `type` are optional
 * strings. Invalid json (including invalid UTF-8) or a non-object fails.
 */
expected<RequestEnvelope, error_code> decode_request(std::string_view text);

string encode_request(const RequestEnvelope& request);

string encode_response(const ResponseEnvelope& response);

/**
 * @brief Decode a response. The body is a failure iff `type` is the failure type.
 */
expected<ResponseEnvelope, error_code> decode_response(std::string_view text);

} // namespace tether::session
