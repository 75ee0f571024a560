#pragma once
#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace visionsync {

struct ExecResult {
  std::string output; // stdout and stderr, interleaved
  int exit_status = 0;
};

// POSIX file-type bits as carried in SFTP attributes.
inline constexpr std::uint32_t kModeTypeMask = 0170000;
inline constexpr std::uint32_t kModeDirectory = 0040000;

inline bool is_directory_mode(std::uint32_t permissions) {
  return (permissions & kModeTypeMask) == kModeDirectory;
}

// Secure shell plus file-transfer sub-channel. Implementations throw
// Error(AuthenticationFailed) from connect() on rejected credentials,
// Error(TransportLost) when the connection drops and
// Error(RemoteOperationFailed) when the server refuses an operation.
class IRemoteBackend {
public:
  virtual ~IRemoteBackend() = default;

  virtual void connect(const HostConfiguration &host) = 0;
  virtual bool is_connected() const = 0;

  // Runs `command` through the login shell, inside `working_dir` unless it
  // is empty.
  virtual ExecResult exec(const std::string &command,
                          const std::string &working_dir) = 0;

  virtual void open_sftp() = 0;
  virtual void close_sftp() = 0;

  virtual std::string realpath(const std::string &path) = 0;
  // Raw directory entries (name, size, modified, permissions), including
  // "." and "..". path and is_directory are left for the caller.
  virtual std::vector<RemoteFile> list(const std::string &path) = 0;
  // Throws Error(RemoteOperationFailed) when the file exceeds max_bytes.
  virtual std::string read(const std::string &path,
                           std::uint64_t max_bytes) = 0;
  virtual void write(const std::string &path, const std::string &data) = 0;
  // unlink for files, rmdir for (empty) directories.
  virtual void remove(const std::string &path, bool is_directory) = 0;

  // Closes the sub-channel and the transport. Never throws.
  virtual void close() = 0;
};

} // namespace visionsync
