
#include "error-codes.hpp"

#include <string>

namespace tether
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "tether"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::invalid_configuration: return "invalid configuration";
      case ecode::trust_material_error: return "trust material error";
      case ecode::handshake_failure: return "handshake failure";
      case ecode::interrupted_connect: return "interrupted connect";
      case ecode::malformed_payload: return "malformed payload";
      case ecode::transport_error: return "transport error";
      case ecode::invocation_failure: return "invocation failure";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

SessionError::SessionError(ecode code, const std::string& what)
    : std::system_error{make_error_code(code), what}
{}

} // namespace tether
