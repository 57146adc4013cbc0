#pragma once
/**
 * @file error.hpp
 * @brief Error codes shared by every layer of ebc-link.
 *
 * Failure is always signaled by a returned code, never by an exception.
 * to_string() gives a stable snake_case token so the CLI can print
 * "status=error reason=<token>" lines that scripts can grep.
 */

#include <cstdint>

namespace ebc {

enum class Error : uint8_t {
  None = 0,
  ConnectionError,     ///< transport open or connect handshake failed (fatal at startup)
  NotConnected,        ///< command attempted while the transport is closed
  InvalidNibble,       ///< mode or command outside 0..15
  OutOfRange,          ///< value outside the encodable 0..57599 domain
  InvalidLength,       ///< codec input of the wrong size
  InvalidMode,         ///< mode not valid for the requested operation
  CommunicationError,  ///< write failed mid-operation
  Interrupted,         ///< the driver asked the polling loop to stop
  OutputExists,        ///< output file exists and neither overwrite nor append was asked for
  OutputOpenFailed,    ///< output file could not be opened for writing
  ConflictingActions   ///< more than one action requested on the command line
};

inline const char* to_string(Error e) {
  switch (e) {
    case Error::None:               return "ok";
    case Error::ConnectionError:    return "connection_error";
    case Error::NotConnected:       return "not_connected";
    case Error::InvalidNibble:      return "invalid_nibble";
    case Error::OutOfRange:         return "out_of_range";
    case Error::InvalidLength:      return "invalid_length";
    case Error::InvalidMode:        return "invalid_mode";
    case Error::CommunicationError: return "communication_error";
    case Error::Interrupted:        return "interrupted";
    case Error::OutputExists:       return "output_exists";
    case Error::OutputOpenFailed:   return "output_open_failed";
    case Error::ConflictingActions: return "need_at_most_one_action";
  }
  return "unknown";
}

} // namespace ebc
