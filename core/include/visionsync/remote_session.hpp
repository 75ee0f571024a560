#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "remote_backend.hpp"
#include "types.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace visionsync {

// One terminal / file-browser session against a remote host.
//
// Not thread-safe: the owner serializes calls (one command in flight).
// Remote operations throw Error(NotConnected) outside the Connected state and
// Error(RemoteOperationFailed) or Error(TransportLost) when the backend fails;
// the session stays usable and a fresh connect() is always allowed.
class RemoteSession {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  RemoteSession(Config cfg, std::shared_ptr<IRemoteBackend> backend,
                Clock clock = nullptr);
  RemoteSession(const RemoteSession &) = delete;
  RemoteSession &operator=(const RemoteSession &) = delete;
  ~RemoteSession();

  // Authenticates, opens the file channel, resolves the home directory and
  // lists it. Returns false with state() == Failed on any error; never
  // retries.
  bool connect(const HostConfiguration &host);
  void disconnect();

  // Runs `command` in the current directory and returns its output. The
  // "$ command" prompt and the output are appended to the terminal buffer.
  std::string execute_command(const std::string &command);

  // Canonical listing, directories first then case-insensitive name. An
  // empty path means the current directory. Served from cache within the TTL.
  std::vector<RemoteFile> list_directory(const std::string &path = {});
  // Drops the cached listing, then lists again.
  std::vector<RemoteFile> refresh_directory(const std::string &path);
  // Unexpired cache entry for a canonical path, without a round trip.
  std::optional<std::vector<RemoteFile>>
  cached_listing(const std::string &path);
  void clear_cache();

  // Bounded by the configured preview limit.
  std::string read_file(const std::string &path);
  // Uploads and invalidates the parent listing.
  void write_file(const std::string &path, const std::string &data);
  // Relative names land in the current directory. Returns the remote path.
  std::string upload(const std::string &name, const std::string &data);
  void delete_file(const RemoteFile &file);

  ConnectionState state() const { return state_; }
  std::string last_error() const { return last_error_; }
  const std::optional<HostConfiguration> &host() const { return host_; }
  const std::string &current_directory() const { return current_dir_; }

  const std::vector<std::string> &history() const { return history_; }
  std::optional<std::string> history_at(size_t i) const;

  std::vector<std::string> output_lines() const {
    return {output_.begin(), output_.end()};
  }
  std::string output_text() const;
  void clear_output() { output_.clear(); }

private:
  struct CacheEntry {
    std::vector<RemoteFile> entries;
    std::chrono::steady_clock::time_point fetched;
  };

  Config cfg_;
  std::shared_ptr<IRemoteBackend> backend_;
  Clock clock_;

  ConnectionState state_;
  std::string last_error_;
  std::optional<HostConfiguration> host_;
  std::string current_dir_;
  std::vector<std::string> history_;
  std::deque<std::string> output_;
  std::map<std::string, CacheEntry> cache_;
  // Requested path -> canonical path, for paths that differ.
  std::map<std::string, std::string> aliases_;

  void require_connected() const;
  // Logs; a lost transport moves the session to Failed.
  void note_failure(const Error &e, const std::string &what);
  void add_output(const std::string &text);
  void run_pwd();
  std::string canonical(const std::string &path);
  std::string join(const std::string &dir, const std::string &name) const;
  static std::string parent_path(const std::string &path);
  void invalidate(const std::string &path);
};

} // namespace visionsync
