
#pragma once

#include <cstdint>
#include <string>

namespace tether::rpc {

/**
 * @brief Envelope sent immediately before every request and response body.
 */
struct Header {
  uint64_t sequence{0};        //!< Chosen by the client, echoed by the server
  std::string procedure_name;  //!< "Service.Method"
  std::string error_text;      //!< Empty unless the call failed on the server

  bool operator==(const Header&) const = default;
};

} // namespace tether::rpc
