#pragma once
#include <stdexcept>
#include <string>

namespace visionsync {

enum class ErrorCode {
  DiscoveryUnavailable,
  HandshakeRejected,
  TransportLost,
  DecodeError,
  AuthenticationFailed,
  RemoteOperationFailed,
  NotConnected,
  InvalidArgument,
  ConfigError,
};

// Stable wire/log form, e.g. "E_TRANSPORT_LOST".
const char *error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

  // "E_CODE: message"
  std::string describe() const;

private:
  ErrorCode code_;
};

} // namespace visionsync
