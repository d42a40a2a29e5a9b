
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
      case ecode::system_error: return "system error";
      case ecode::logic_error: return "logic error";
      case ecode::exception_occurred: return "exception occurred";
      case ecode::argument_error: return "argument error";
      case ecode::type_error: return "type error";
      case ecode::end_of_stream: return "end of stream";
      case ecode::premature_eof: return "premature eof";
      case ecode::object_too_large: return "object too large";
      case ecode::invalid_data: return "invalid data";
      case ecode::invalid_address: return "invalid address";
      case ecode::shutdown: return "connection shut down";
      case ecode::already_closed: return "connection already closed";
      case ecode::invalid_codec: return "invalid codec type";
      case ecode::bad_magic: return "invalid magic number";
      case ecode::duplicate_service: return "service already defined";
      case ecode::duplicate_method: return "method already defined";
      case ecode::invalid_service_name: return "invalid service name";
      case ecode::invalid_method_name: return "invalid method name";
      case ecode::ill_formed_name: return "service/method request ill-formed";
      case ecode::service_not_found: return "cannot find service";
      case ecode::method_not_found: return "cannot find method";
      case ecode::remote_error: return "remote error";
      case ecode::deadline_exceeded: return "deadline exceeded";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category_instance{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category_instance}; }

const std::error_category& ecode_category() noexcept { return ecode_category_instance; }

} // namespace tether
