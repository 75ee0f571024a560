#include "visionsync/errors.hpp"

namespace visionsync {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::DiscoveryUnavailable:
    return "E_DISCOVERY_UNAVAILABLE";
  case ErrorCode::HandshakeRejected:
    return "E_HANDSHAKE_REJECTED";
  case ErrorCode::TransportLost:
    return "E_TRANSPORT_LOST";
  case ErrorCode::DecodeError:
    return "E_DECODE";
  case ErrorCode::AuthenticationFailed:
    return "E_AUTH_FAILED";
  case ErrorCode::RemoteOperationFailed:
    return "E_REMOTE_OP_FAILED";
  case ErrorCode::NotConnected:
    return "E_NOT_CONNECTED";
  case ErrorCode::InvalidArgument:
    return "E_BAD_ARG";
  case ErrorCode::ConfigError:
    return "E_CONFIG";
  }
  return "E_UNKNOWN";
}

std::string Error::describe() const {
  return std::string(error_code_name(code_)) + ": " + what();
}

} // namespace visionsync
