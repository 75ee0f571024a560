#include "visionsync/ssh2_backend.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstdlib>
#include <mutex>

namespace visionsync {

namespace {

std::once_flag g_libssh2_once;

void init_libssh2() {
  std::call_once(g_libssh2_once, [] {
    if (libssh2_init(0) != 0)
      throw Error(ErrorCode::TransportLost, "libssh2_init failed");
    std::atexit([] { libssh2_exit(); });
  });
}

const char *sftp_status_text(unsigned long code) {
  switch (code) {
  case LIBSSH2_FX_EOF:
    return "end of file";
  case LIBSSH2_FX_NO_SUCH_FILE:
    return "No such file or directory";
  case LIBSSH2_FX_PERMISSION_DENIED:
    return "Permission denied";
  case LIBSSH2_FX_FAILURE:
    return "Failure";
  case LIBSSH2_FX_NO_CONNECTION:
  case LIBSSH2_FX_CONNECTION_LOST:
    return "Connection lost";
  case LIBSSH2_FX_FILE_ALREADY_EXISTS:
    return "File already exists";
  case LIBSSH2_FX_WRITE_PROTECT:
    return "Write protected";
  case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
  case LIBSSH2_FX_QUOTA_EXCEEDED:
    return "No space left";
  case LIBSSH2_FX_DIR_NOT_EMPTY:
    return "Directory not empty";
  case LIBSSH2_FX_NOT_A_DIRECTORY:
    return "Not a directory";
  default:
    return "SFTP error";
  }
}

bool is_transport_errno(int rc) {
  return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
         rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
         rc == LIBSSH2_ERROR_SOCKET_TIMEOUT || rc == LIBSSH2_ERROR_TIMEOUT;
}

// Frees the channel on scope exit.
class ChannelGuard {
public:
  explicit ChannelGuard(LIBSSH2_CHANNEL *ch) : ch_(ch) {}
  ~ChannelGuard() {
    if (ch_)
      libssh2_channel_free(ch_);
  }
  ChannelGuard(const ChannelGuard &) = delete;
  ChannelGuard &operator=(const ChannelGuard &) = delete;
  LIBSSH2_CHANNEL *get() const { return ch_; }

private:
  LIBSSH2_CHANNEL *ch_;
};

class SftpHandleGuard {
public:
  explicit SftpHandleGuard(LIBSSH2_SFTP_HANDLE *h) : h_(h) {}
  ~SftpHandleGuard() {
    if (h_)
      libssh2_sftp_close_handle(h_);
  }
  SftpHandleGuard(const SftpHandleGuard &) = delete;
  SftpHandleGuard &operator=(const SftpHandleGuard &) = delete;
  LIBSSH2_SFTP_HANDLE *get() const { return h_; }

private:
  LIBSSH2_SFTP_HANDLE *h_;
};

} // namespace

std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

Ssh2Backend::Ssh2Backend(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

Ssh2Backend::~Ssh2Backend() { close(); }

std::string Ssh2Backend::session_error() const {
  if (!session_)
    return "no session";
  char *msg = nullptr;
  int len = 0;
  libssh2_session_last_error(session_, &msg, &len, 0);
  return msg && len > 0 ? std::string(msg, (size_t)len) : "unknown error";
}

void Ssh2Backend::throw_sftp(const std::string &what,
                             const std::string &path) const {
  int rc = libssh2_session_last_errno(session_);
  if (rc != LIBSSH2_ERROR_SFTP_PROTOCOL) {
    ErrorCode code = is_transport_errno(rc) ? ErrorCode::TransportLost
                                            : ErrorCode::RemoteOperationFailed;
    throw Error(code, what + " " + path + ": " + session_error());
  }
  unsigned long status = libssh2_sftp_last_error(sftp_);
  ErrorCode code = (status == LIBSSH2_FX_NO_CONNECTION ||
                    status == LIBSSH2_FX_CONNECTION_LOST)
                       ? ErrorCode::TransportLost
                       : ErrorCode::RemoteOperationFailed;
  throw Error(code, what + " " + path + ": " + sftp_status_text(status));
}

void Ssh2Backend::require_session() const {
  if (!session_)
    throw Error(ErrorCode::NotConnected, "SSH session is not connected");
}

void Ssh2Backend::require_sftp() const {
  require_session();
  if (!sftp_)
    throw Error(ErrorCode::NotConnected, "SFTP channel is not open");
}

void Ssh2Backend::connect(const HostConfiguration &host) {
  init_libssh2();
  std::lock_guard<std::mutex> lk(mu_);
  close_locked();

  sock_ = net::tcp_connect(host.hostname, host.port, timeout_);
  session_ = libssh2_session_init();
  if (!session_) {
    sock_.close();
    throw Error(ErrorCode::TransportLost, "libssh2_session_init failed");
  }
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(session_, (long)timeout_.count());

  if (libssh2_session_handshake(session_, sock_.fd()) != 0) {
    std::string err = "SSH handshake failed: " + session_error();
    close_locked();
    throw Error(ErrorCode::TransportLost, err);
  }

  if (libssh2_userauth_password(session_, host.username.c_str(),
                                host.password.c_str()) != 0) {
    std::string err = "Authentication failed: " + session_error();
    close_locked();
    throw Error(ErrorCode::AuthenticationFailed, err);
  }
  VS_LOG_INFO(LogCategory::Terminal, "SSH session established with " +
                                         host.username + "@" + host.hostname);
}

bool Ssh2Backend::is_connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return session_ != nullptr;
}

ExecResult Ssh2Backend::exec(const std::string &command,
                             const std::string &working_dir) {
  std::lock_guard<std::mutex> lk(mu_);
  require_session();

  ChannelGuard ch(libssh2_channel_open_session(session_));
  if (!ch.get()) {
    int rc = libssh2_session_last_errno(session_);
    throw Error(is_transport_errno(rc) ? ErrorCode::TransportLost
                                       : ErrorCode::RemoteOperationFailed,
                "cannot open channel: " + session_error());
  }
  libssh2_channel_handle_extended_data2(ch.get(),
                                        LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);

  std::string full = command;
  if (!working_dir.empty())
    full = "cd " + shell_quote(working_dir) + " && " + command;
  if (libssh2_channel_exec(ch.get(), full.c_str()) != 0)
    throw Error(ErrorCode::RemoteOperationFailed,
                "exec failed: " + session_error());

  ExecResult res;
  char buf[4096];
  while (true) {
    ssize_t n = libssh2_channel_read(ch.get(), buf, sizeof(buf));
    if (n > 0) {
      res.output.append(buf, (size_t)n);
      continue;
    }
    if (n == 0)
      break;
    throw Error(is_transport_errno((int)n) ? ErrorCode::TransportLost
                                           : ErrorCode::RemoteOperationFailed,
                "read failed: " + session_error());
  }
  libssh2_channel_close(ch.get());
  libssh2_channel_wait_closed(ch.get());
  res.exit_status = libssh2_channel_get_exit_status(ch.get());
  return res;
}

void Ssh2Backend::open_sftp() {
  std::lock_guard<std::mutex> lk(mu_);
  require_session();
  if (sftp_)
    return;
  sftp_ = libssh2_sftp_init(session_);
  if (!sftp_)
    throw Error(ErrorCode::RemoteOperationFailed,
                "SFTP subsystem unavailable: " + session_error());
}

void Ssh2Backend::close_sftp() {
  std::lock_guard<std::mutex> lk(mu_);
  if (sftp_) {
    libssh2_sftp_shutdown(sftp_);
    sftp_ = nullptr;
  }
}

std::string Ssh2Backend::realpath(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  require_sftp();
  char buf[4096];
  int n = libssh2_sftp_realpath(sftp_, path.c_str(), buf, sizeof(buf));
  if (n < 0)
    throw_sftp("realpath", path);
  return std::string(buf, (size_t)n);
}

std::vector<RemoteFile> Ssh2Backend::list(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  require_sftp();
  SftpHandleGuard dir(libssh2_sftp_opendir(sftp_, path.c_str()));
  if (!dir.get())
    throw_sftp("opendir", path);

  std::vector<RemoteFile> out;
  char name[1024];
  LIBSSH2_SFTP_ATTRIBUTES attrs;
  while (true) {
    int n = libssh2_sftp_readdir(dir.get(), name, sizeof(name), &attrs);
    if (n == 0)
      break;
    if (n < 0)
      throw_sftp("readdir", path);
    RemoteFile f;
    f.name.assign(name, (size_t)n);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
      f.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
      f.modified = (std::int64_t)attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
      f.permissions = (std::uint32_t)attrs.permissions;
    out.push_back(std::move(f));
  }
  return out;
}

std::string Ssh2Backend::read(const std::string &path,
                              std::uint64_t max_bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  require_sftp();
  SftpHandleGuard fh(
      libssh2_sftp_open(sftp_, path.c_str(), LIBSSH2_FXF_READ, 0));
  if (!fh.get())
    throw_sftp("open", path);

  LIBSSH2_SFTP_ATTRIBUTES attrs;
  if (libssh2_sftp_fstat(fh.get(), &attrs) == 0 &&
      (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) && attrs.filesize > max_bytes)
    throw Error(ErrorCode::RemoteOperationFailed,
                "File too large to read: " + path);

  std::string data;
  char buf[16384];
  while (true) {
    ssize_t n = libssh2_sftp_read(fh.get(), buf, sizeof(buf));
    if (n == 0)
      break;
    if (n < 0)
      throw_sftp("read", path);
    data.append(buf, (size_t)n);
    if (data.size() > max_bytes)
      throw Error(ErrorCode::RemoteOperationFailed,
                  "File too large to read: " + path);
  }
  return data;
}

void Ssh2Backend::write(const std::string &path, const std::string &data) {
  std::lock_guard<std::mutex> lk(mu_);
  require_sftp();
  SftpHandleGuard fh(libssh2_sftp_open(
      sftp_, path.c_str(),
      LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
      LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP |
          LIBSSH2_SFTP_S_IROTH));
  if (!fh.get())
    throw_sftp("open", path);

  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = libssh2_sftp_write(fh.get(), data.data() + off,
                                   data.size() - off);
    if (n < 0)
      throw_sftp("write", path);
    off += (size_t)n;
  }
}

void Ssh2Backend::remove(const std::string &path, bool is_directory) {
  std::lock_guard<std::mutex> lk(mu_);
  require_sftp();
  int rc = is_directory ? libssh2_sftp_rmdir(sftp_, path.c_str())
                        : libssh2_sftp_unlink(sftp_, path.c_str());
  if (rc != 0)
    throw_sftp("remove", path);
}

void Ssh2Backend::close() {
  std::lock_guard<std::mutex> lk(mu_);
  close_locked();
}

void Ssh2Backend::close_locked() {
  if (sftp_) {
    libssh2_sftp_shutdown(sftp_);
    sftp_ = nullptr;
  }
  if (session_) {
    libssh2_session_disconnect(session_, "Normal shutdown");
    libssh2_session_free(session_);
    session_ = nullptr;
  }
  sock_.close();
}

} // namespace visionsync
