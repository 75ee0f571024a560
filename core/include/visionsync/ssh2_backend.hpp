#pragma once
#include "net.hpp"
#include "remote_backend.hpp"

#include <chrono>
#include <mutex>

// libssh2 handles, kept out of the public header.
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

namespace visionsync {

// IRemoteBackend over libssh2 in blocking mode. Password authentication;
// host keys are not pinned.
class Ssh2Backend final : public IRemoteBackend {
public:
  explicit Ssh2Backend(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));
  ~Ssh2Backend() override;
  Ssh2Backend(const Ssh2Backend &) = delete;
  Ssh2Backend &operator=(const Ssh2Backend &) = delete;

  void connect(const HostConfiguration &host) override;
  bool is_connected() const override;

  ExecResult exec(const std::string &command,
                  const std::string &working_dir) override;

  void open_sftp() override;
  void close_sftp() override;

  std::string realpath(const std::string &path) override;
  std::vector<RemoteFile> list(const std::string &path) override;
  std::string read(const std::string &path, std::uint64_t max_bytes) override;
  void write(const std::string &path, const std::string &data) override;
  void remove(const std::string &path, bool is_directory) override;

  void close() override;

private:
  std::chrono::milliseconds timeout_;
  mutable std::mutex mu_;
  net::Socket sock_;
  LIBSSH2_SESSION *session_ = nullptr;
  LIBSSH2_SFTP *sftp_ = nullptr;

  std::string session_error() const;
  [[noreturn]] void throw_sftp(const std::string &what,
                               const std::string &path) const;
  void require_session() const;
  void require_sftp() const;
  void close_locked();
};

// POSIX single-quote escaping for a shell word.
std::string shell_quote(const std::string &s);

} // namespace visionsync
