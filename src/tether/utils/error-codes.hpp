
#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup tether-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The client connection is gone
 * return make_error_code(ecode::shutdown);
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
   okay = 0,           //!< i.e., everything's okay.
   system_error,       //!< An operating system (or transport) error.
   logic_error,        //!< Faulty logic in the program.
   exception_occurred, //!< Exception caught and forwarded as an error_code.
   argument_error,     //!< An invalid argument was supplied.
   type_error,         //!< A value does not have the shape of the requested type.

   end_of_stream,    //!< The peer closed the stream on a message boundary.
   premature_eof,    //!< The peer closed the stream in the middle of a message.
   object_too_large, //!< Attempt to read/write an object that is too large.
   invalid_data,     //!< Input data (file/network/etc.) was invalid.
   invalid_address,  //!< Unknown network, or malformed network address.

   shutdown,             //!< The connection was shut down; the call cannot complete.
   already_closed,       //!< Close was called on a client that is already closed.
   invalid_codec,        //!< No codec is registered for the requested type tag.
   bad_magic,            //!< The connection preamble did not start with the magic number.
   duplicate_service,    //!< A service with the same name is already registered.
   duplicate_method,     //!< A method with the same name is already bound.
   invalid_service_name, //!< A service name must look like an exported identifier.
   invalid_method_name,  //!< A method name must look like an exported identifier.
   ill_formed_name,      //!< A procedure name must look like "Service.Method".
   service_not_found,    //!< No such service.
   method_not_found,     //!< No such method on the service.
   remote_error,         //!< The server reported a call-level error.
   deadline_exceeded     //!< The caller stopped waiting for the response.
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

/**
 * @ingroup error-codes
 * @brief The category of all `ecode` error codes.
 */
const std::error_category& ecode_category() noexcept;
} // namespace tether
