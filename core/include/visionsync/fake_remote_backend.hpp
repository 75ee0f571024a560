#pragma once
#include "errors.hpp"
#include "remote_backend.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace visionsync {

// In-memory remote host: a small filesystem plus a scripted shell that
// understands pwd, cd, echo and && chains. Used by tests and the view-model demo paths.
class FakeRemoteBackend final : public IRemoteBackend {
public:
  struct Node {
    bool is_directory = false;
    std::string data;
    std::int64_t modified = 0;
  };

  struct Call {
    std::string command;
    std::string working_dir;
  };

  explicit FakeRemoteBackend(std::string home = "/home/dev");

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

  // Test helpers
  void add_dir(const std::string &path, std::int64_t modified = 0);
  void add_file(const std::string &path, const std::string &data,
                std::int64_t modified = 0);
  bool exists(const std::string &path) const;
  void script(const std::string &command, ExecResult result);
  void set_password(const std::string &password);
  // Every later operation throws Error(TransportLost) until reconnect.
  void drop_connection();
  // The next operation of any kind throws this error once.
  void fail_next(ErrorCode code, const std::string &message);

  std::vector<Call> exec_calls() const;
  int list_calls() const;
  int realpath_calls() const;
  int connect_calls() const;
  bool sftp_open() const;

private:
  mutable std::mutex mu_;
  std::string home_;
  std::string password_;
  std::map<std::string, Node> fs_;
  std::map<std::string, ExecResult> scripted_;
  bool connected_ = false;
  bool sftp_ = false;
  bool dropped_ = false;
  std::optional<Error> next_error_;
  std::vector<Call> exec_calls_;
  int list_calls_ = 0;
  int realpath_calls_ = 0;
  int connect_calls_ = 0;

  void check_locked(bool need_sftp);
  ExecResult run_segment_locked(const std::string &cmd, std::string &wd);
  std::string resolve(const std::string &base, const std::string &path) const;
  std::string parent_of(const std::string &path) const;
};

} // namespace visionsync
