
#pragma once

#include <string>
#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup tether-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The relay sent something that isn't an envelope
 * return make_unexpected(make_error_code(ecode::malformed_payload));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace tether
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of tether error codes.
 */
enum class ecode : int {
   okay = 0, //!< i.e., everything's okay.

   invalid_configuration, //!< Session configuration failed validation.
   trust_material_error,  //!< Key or trust material could not be loaded/applied.
   handshake_failure,     //!< TLS context setup, connect, or upgrade was rejected.
   interrupted_connect,   //!< The blocking connect was interrupted.
   malformed_payload,     //!< An inbound frame did not decode to an envelope.
   transport_error,       //!< The connection failed after it was opened.
   invocation_failure     //!< The invocation target could not produce a response.
};

/**
 * @ingroup error-codes
 * @brief Thrown across the synchronous boundaries of a debug session (start, configuration).
 */
class SessionError : public std::system_error
{
 public:
   SessionError(ecode code, const std::string& what);
   SessionError(error_code ec, const std::string& what)
       : std::system_error{ec, what}
   {}
};

} // namespace tether

namespace std
{
template<> struct is_error_code_enum<tether::ecode> : true_type
{};
} // namespace std

namespace tether
{
error_code make_error_code(ecode);

} // namespace tether
