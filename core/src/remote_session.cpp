#include "visionsync/remote_session.hpp"
#include "visionsync/crypto.hpp"
#include "visionsync/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace visionsync {

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static std::string last_line(const std::string &s) {
  std::string t = trim(s);
  auto nl = t.rfind('\n');
  return nl == std::string::npos ? t : trim(t.substr(nl + 1));
}

// Everything before the last non-empty line, keeping its line breaks.
static std::string drop_last_line(const std::string &s) {
  auto end = s.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return {};
  auto nl = s.rfind('\n', end);
  return nl == std::string::npos ? std::string() : s.substr(0, nl + 1);
}

static bool less_ci(const std::string &a, const std::string &b) {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower((unsigned char)x) < std::tolower((unsigned char)y);
      });
}

RemoteSession::RemoteSession(Config cfg,
                             std::shared_ptr<IRemoteBackend> backend,
                             Clock clock)
    : cfg_(std::move(cfg)), backend_(std::move(backend)),
      clock_(clock ? std::move(clock) : Clock(&std::chrono::steady_clock::now)) {
}

RemoteSession::~RemoteSession() { disconnect(); }

bool RemoteSession::connect(const HostConfiguration &host) {
  if (state_.phase == ConnectionPhase::Connected ||
      state_.phase == ConnectionPhase::Connecting) {
    VS_LOG_WARN(LogCategory::Terminal, "Already connected or connecting");
    return state_.is_connected();
  }

  state_ = ConnectionState::connecting();
  last_error_.clear();
  host_ = host;
  current_dir_.clear();
  cache_.clear();
  aliases_.clear();
  VS_LOG_INFO(LogCategory::Terminal,
              "Starting SSH connection to " + host.hostname + ":" +
                  std::to_string(host.port) + " as " + host.username);

  try {
    backend_->connect(host);
    backend_->open_sftp();
    state_ = ConnectionState::connected();
    add_output("Connected to " + host.hostname + " as " + host.username);
    add_output("Session ID: " + crypto::new_uuid().substr(0, 8));
    add_output("");
    run_pwd();
    list_directory(current_dir_);
  } catch (const Error &e) {
    last_error_ = e.what();
    state_ = ConnectionState::failed(e.what());
    current_dir_.clear();
    add_output(std::string("Connection failed: ") + e.what());
    VS_LOG_ERROR(LogCategory::Terminal,
                 std::string("SSH connection failed: ") + e.what());
    backend_->close();
    return false;
  }
  VS_LOG_INFO(LogCategory::Terminal, "Connected, home is " + current_dir_);
  return true;
}

void RemoteSession::run_pwd() {
  ExecResult r = backend_->exec("pwd", current_dir_);
  std::string dir = last_line(r.output);
  if (r.exit_status == 0 && !dir.empty() && dir[0] == '/')
    current_dir_ = dir;
  else
    current_dir_ = backend_->realpath(".");
}

void RemoteSession::disconnect() {
  if (state_.phase == ConnectionPhase::Disconnected)
    return;
  VS_LOG_INFO(LogCategory::Terminal, "Disconnecting SSH session");
  backend_->close_sftp();
  backend_->close();
  bool was_connected = state_.is_connected();
  state_ = ConnectionState::disconnected();
  current_dir_.clear();
  cache_.clear();
  aliases_.clear();
  if (was_connected)
    add_output("Disconnected from server");
}

void RemoteSession::require_connected() const {
  if (!state_.is_connected())
    throw Error(ErrorCode::NotConnected, "Not connected to server");
}

void RemoteSession::note_failure(const Error &e, const std::string &what) {
  VS_LOG_ERROR(LogCategory::Terminal, what + " failed: " + e.what());
  if (e.code() == ErrorCode::TransportLost) {
    last_error_ = e.what();
    state_ = ConnectionState::failed(e.what());
    backend_->close();
  }
}

std::string RemoteSession::execute_command(const std::string &command) {
  if (!state_.is_connected()) {
    add_output("Error: Not connected to server");
    throw Error(ErrorCode::NotConnected, "Not connected to server");
  }
  const std::string cmd = trim(command);
  if (cmd.empty())
    return {};

  if (history_.empty() || history_.back() != cmd)
    history_.push_back(cmd);
  add_output("$ " + cmd);
  VS_LOG_DEBUG(LogCategory::Terminal, "Executing: " + cmd);

  std::string out;
  try {
    if (cmd == "cd" || cmd.rfind("cd ", 0) == 0) {
      // One round trip: the trailing pwd line reports where the shell ended.
      ExecResult r = backend_->exec(cmd + " && pwd", current_dir_);
      out = r.output;
      std::string dir = last_line(out);
      if (r.exit_status == 0 && !dir.empty() && dir[0] == '/') {
        current_dir_ = dir;
        out = drop_last_line(out);
      }
      if (!out.empty())
        add_output(out);
    } else {
      ExecResult r = backend_->exec(cmd, current_dir_);
      out = r.output;
      if (!out.empty())
        add_output(out);
      if (cmd == "pwd" && r.exit_status == 0) {
        std::string dir = last_line(out);
        if (!dir.empty())
          current_dir_ = dir;
      }
    }
  } catch (const Error &e) {
    add_output(std::string("Error executing command: ") + e.what());
    note_failure(e, "Command");
    throw;
  }
  return out;
}

std::string RemoteSession::join(const std::string &dir,
                                const std::string &name) const {
  if (!name.empty() && name[0] == '/')
    return name;
  if (dir.empty() || dir == "/")
    return "/" + name;
  return dir + "/" + name;
}

std::string RemoteSession::parent_path(const std::string &path) {
  auto slash = path.rfind('/');
  if (slash == std::string::npos || slash == 0)
    return "/";
  return path.substr(0, slash);
}

std::string RemoteSession::canonical(const std::string &path) {
  return backend_->realpath(join(current_dir_, path));
}

std::optional<std::vector<RemoteFile>>
RemoteSession::cached_listing(const std::string &path) {
  auto it = cache_.find(path);
  if (it == cache_.end())
    return std::nullopt;
  if (clock_() - it->second.fetched >= cfg_.directory_cache_ttl) {
    cache_.erase(it);
    return std::nullopt;
  }
  return it->second.entries;
}

std::vector<RemoteFile> RemoteSession::list_directory(const std::string &path) {
  require_connected();
  const std::string requested =
      join(current_dir_, path.empty() ? current_dir_ : path);
  if (auto hit = cached_listing(requested))
    return *hit;
  auto alias = aliases_.find(requested);
  if (alias != aliases_.end()) {
    if (auto hit = cached_listing(alias->second))
      return *hit;
  }

  try {
    const std::string canon = canonical(requested);
    if (canon != requested) {
      aliases_[requested] = canon;
      if (auto hit = cached_listing(canon))
        return *hit;
    }

    std::vector<RemoteFile> files;
    for (auto &f : backend_->list(canon)) {
      if (f.name == "." || f.name == "..")
        continue;
      f.path = join(canon, f.name);
      f.is_directory = is_directory_mode(f.permissions);
      files.push_back(std::move(f));
    }
    std::sort(files.begin(), files.end(),
              [](const RemoteFile &a, const RemoteFile &b) {
                if (a.is_directory != b.is_directory)
                  return a.is_directory;
                if (less_ci(a.name, b.name))
                  return true;
                if (less_ci(b.name, a.name))
                  return false;
                return a.name < b.name;
              });
    cache_[canon] = CacheEntry{files, clock_()};
    VS_LOG_DEBUG(LogCategory::FileManager,
                 "Listed " + canon + ": " + std::to_string(files.size()) +
                     " entries");
    return files;
  } catch (const Error &e) {
    note_failure(e, "Listing " + requested);
    throw;
  }
}

std::vector<RemoteFile>
RemoteSession::refresh_directory(const std::string &path) {
  invalidate(join(current_dir_, path.empty() ? current_dir_ : path));
  return list_directory(path);
}

void RemoteSession::invalidate(const std::string &path) {
  cache_.erase(path);
  auto alias = aliases_.find(path);
  if (alias != aliases_.end())
    cache_.erase(alias->second);
}

void RemoteSession::clear_cache() {
  cache_.clear();
  aliases_.clear();
}

std::string RemoteSession::read_file(const std::string &path) {
  require_connected();
  try {
    return backend_->read(join(current_dir_, path), cfg_.max_preview_bytes);
  } catch (const Error &e) {
    note_failure(e, "Reading " + path);
    throw;
  }
}

void RemoteSession::write_file(const std::string &path,
                               const std::string &data) {
  require_connected();
  const std::string full = join(current_dir_, path);
  try {
    backend_->write(full, data);
  } catch (const Error &e) {
    note_failure(e, "Writing " + full);
    throw;
  }
  invalidate(parent_path(full));
  VS_LOG_INFO(LogCategory::FileManager,
              "Uploaded " + full + " (" + std::to_string(data.size()) +
                  " bytes)");
}

std::string RemoteSession::upload(const std::string &name,
                                  const std::string &data) {
  const std::string full = join(current_dir_, name);
  write_file(full, data);
  return full;
}

void RemoteSession::delete_file(const RemoteFile &file) {
  require_connected();
  try {
    backend_->remove(file.path, file.is_directory);
  } catch (const Error &e) {
    note_failure(e, "Deleting " + file.path);
    throw;
  }
  invalidate(parent_path(file.path));
  if (file.is_directory)
    invalidate(file.path);
  VS_LOG_INFO(LogCategory::FileManager, "Deleted " + file.path);
}

std::optional<std::string> RemoteSession::history_at(size_t i) const {
  if (i >= history_.size())
    return std::nullopt;
  return history_[i];
}

std::string RemoteSession::output_text() const {
  std::string out;
  for (size_t i = 0; i < output_.size(); ++i) {
    if (i)
      out.push_back('\n');
    out += output_[i];
  }
  return out;
}

void RemoteSession::add_output(const std::string &text) {
  std::string t = text;
  if (!t.empty() && t.back() == '\n')
    t.pop_back();
  std::istringstream ss(t);
  std::string line;
  bool any = false;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    output_.push_back(line);
    any = true;
  }
  if (!any)
    output_.push_back("");
  while (output_.size() > cfg_.terminal_max_lines)
    output_.pop_front();
}

} // namespace visionsync
