#include "visionsync/fake_remote_backend.hpp"

#include <sstream>

namespace visionsync {

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

FakeRemoteBackend::FakeRemoteBackend(std::string home)
    : home_(std::move(home)) {
  fs_["/"] = Node{true, {}, 0};
  add_dir(home_);
}

void FakeRemoteBackend::check_locked(bool need_sftp) {
  if (next_error_) {
    Error e = *next_error_;
    next_error_.reset();
    throw e;
  }
  if (dropped_)
    throw Error(ErrorCode::TransportLost, "Connection lost");
  if (!connected_)
    throw Error(ErrorCode::NotConnected, "SSH session is not connected");
  if (need_sftp && !sftp_)
    throw Error(ErrorCode::NotConnected, "SFTP channel is not open");
}

std::string FakeRemoteBackend::resolve(const std::string &base,
                                       const std::string &path) const {
  std::string p = path;
  if (p == "~" || p.rfind("~/", 0) == 0)
    p = home_ + p.substr(1);
  if (p.empty() || p[0] != '/')
    p = base + "/" + p;

  std::vector<std::string> parts;
  std::istringstream ss(p);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (part.empty() || part == ".")
      continue;
    if (part == "..") {
      if (!parts.empty())
        parts.pop_back();
      continue;
    }
    parts.push_back(part);
  }
  std::string out;
  for (const auto &x : parts)
    out += "/" + x;
  return out.empty() ? "/" : out;
}

std::string FakeRemoteBackend::parent_of(const std::string &path) const {
  auto slash = path.rfind('/');
  if (slash == std::string::npos || slash == 0)
    return "/";
  return path.substr(0, slash);
}

void FakeRemoteBackend::connect(const HostConfiguration &host) {
  std::lock_guard<std::mutex> lk(mu_);
  connect_calls_++;
  if (next_error_) {
    Error e = *next_error_;
    next_error_.reset();
    throw e;
  }
  if (!password_.empty() && host.password != password_)
    throw Error(ErrorCode::AuthenticationFailed,
                "Authentication failed for " + host.username);
  connected_ = true;
  dropped_ = false;
  sftp_ = false;
}

bool FakeRemoteBackend::is_connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connected_ && !dropped_;
}

ExecResult FakeRemoteBackend::exec(const std::string &command,
                                   const std::string &working_dir) {
  std::lock_guard<std::mutex> lk(mu_);
  check_locked(false);
  exec_calls_.push_back({command, working_dir});

  auto it = scripted_.find(command);
  if (it != scripted_.end())
    return it->second;

  // "a && b && c": each part runs in the directory left by the previous one,
  // stopping at the first failure.
  std::string wd = working_dir.empty() ? home_ : working_dir;
  std::string rest = trim(command);
  std::string output;
  for (;;) {
    auto amp = rest.find("&&");
    ExecResult r = run_segment_locked(trim(rest.substr(0, amp)), wd);
    output += r.output;
    if (r.exit_status != 0 || amp == std::string::npos)
      return {output, r.exit_status};
    rest = rest.substr(amp + 2);
  }
}

ExecResult FakeRemoteBackend::run_segment_locked(const std::string &cmd,
                                                 std::string &wd) {
  if (cmd == "cd" || cmd.rfind("cd ", 0) == 0) {
    std::string target = trim(cmd.substr(2));
    std::string dest = target.empty() ? home_ : resolve(wd, target);
    auto node = fs_.find(dest);
    if (node == fs_.end() || !node->second.is_directory)
      return {"sh: cd: " + target + ": No such file or directory\n", 1};
    wd = dest;
    return {"", 0};
  }
  if (cmd == "pwd")
    return {wd + "\n", 0};
  if (cmd.rfind("echo ", 0) == 0)
    return {cmd.substr(5) + "\n", 0};
  if (cmd == "echo")
    return {"\n", 0};
  return {"sh: " + cmd + ": command not found\n", 127};
}

void FakeRemoteBackend::open_sftp() {
  std::lock_guard<std::mutex> lk(mu_);
  check_locked(false);
  sftp_ = true;
}

void FakeRemoteBackend::close_sftp() {
  std::lock_guard<std::mutex> lk(mu_);
  sftp_ = false;
}

std::string FakeRemoteBackend::realpath(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  realpath_calls_++;
  check_locked(true);
  std::string p = resolve(home_, path);
  if (!fs_.count(p))
    throw Error(ErrorCode::RemoteOperationFailed,
                "realpath " + path + ": No such file or directory");
  return p;
}

std::vector<RemoteFile> FakeRemoteBackend::list(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  list_calls_++;
  check_locked(true);
  std::string p = resolve(home_, path);
  auto dir = fs_.find(p);
  if (dir == fs_.end())
    throw Error(ErrorCode::RemoteOperationFailed,
                "opendir " + path + ": No such file or directory");
  if (!dir->second.is_directory)
    throw Error(ErrorCode::RemoteOperationFailed,
                "opendir " + path + ": Not a directory");

  std::vector<RemoteFile> out;
  RemoteFile self;
  self.name = ".";
  self.permissions = kModeDirectory | 0755;
  out.push_back(self);
  RemoteFile up = self;
  up.name = "..";
  out.push_back(up);

  const std::string prefix = p == "/" ? "/" : p + "/";
  for (const auto &[key, node] : fs_) {
    if (key == p || key.rfind(prefix, 0) != 0)
      continue;
    std::string name = key.substr(prefix.size());
    if (name.empty() || name.find('/') != std::string::npos)
      continue;
    RemoteFile f;
    f.name = name;
    f.size = node.is_directory ? 4096 : node.data.size();
    f.modified = node.modified;
    f.permissions = node.is_directory ? (kModeDirectory | 0755) : 0100644;
    out.push_back(std::move(f));
  }
  return out;
}

std::string FakeRemoteBackend::read(const std::string &path,
                                    std::uint64_t max_bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  check_locked(true);
  auto it = fs_.find(resolve(home_, path));
  if (it == fs_.end() || it->second.is_directory)
    throw Error(ErrorCode::RemoteOperationFailed,
                "open " + path + ": No such file or directory");
  if (it->second.data.size() > max_bytes)
    throw Error(ErrorCode::RemoteOperationFailed,
                "File too large to read: " + path);
  return it->second.data;
}

void FakeRemoteBackend::write(const std::string &path,
                              const std::string &data) {
  std::lock_guard<std::mutex> lk(mu_);
  check_locked(true);
  std::string p = resolve(home_, path);
  auto parent = fs_.find(parent_of(p));
  if (parent == fs_.end() || !parent->second.is_directory)
    throw Error(ErrorCode::RemoteOperationFailed,
                "open " + path + ": No such file or directory");
  auto existing = fs_.find(p);
  if (existing != fs_.end() && existing->second.is_directory)
    throw Error(ErrorCode::RemoteOperationFailed,
                "open " + path + ": Is a directory");
  fs_[p] = Node{false, data, 0};
}

void FakeRemoteBackend::remove(const std::string &path, bool is_directory) {
  std::lock_guard<std::mutex> lk(mu_);
  check_locked(true);
  std::string p = resolve(home_, path);
  auto it = fs_.find(p);
  if (it == fs_.end())
    throw Error(ErrorCode::RemoteOperationFailed,
                "remove " + path + ": No such file or directory");
  if (it->second.is_directory != is_directory)
    throw Error(ErrorCode::RemoteOperationFailed,
                "remove " + path + ": Failure");
  if (is_directory) {
    const std::string prefix = p + "/";
    auto child = fs_.lower_bound(prefix);
    if (child != fs_.end() && child->first.rfind(prefix, 0) == 0)
      throw Error(ErrorCode::RemoteOperationFailed,
                  "remove " + path + ": Directory not empty");
  }
  fs_.erase(it);
}

void FakeRemoteBackend::close() {
  std::lock_guard<std::mutex> lk(mu_);
  connected_ = false;
  sftp_ = false;
}

void FakeRemoteBackend::add_dir(const std::string &path,
                                std::int64_t modified) {
  std::lock_guard<std::mutex> lk(mu_);
  std::string p = resolve("/", path);
  // mkdir -p
  std::string built;
  std::istringstream ss(p);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (part.empty())
      continue;
    built += "/" + part;
    if (!fs_.count(built))
      fs_[built] = Node{true, {}, modified};
  }
}

void FakeRemoteBackend::add_file(const std::string &path,
                                 const std::string &data,
                                 std::int64_t modified) {
  std::string p = resolve("/", path);
  add_dir(parent_of(p));
  std::lock_guard<std::mutex> lk(mu_);
  fs_[p] = Node{false, data, modified};
}

bool FakeRemoteBackend::exists(const std::string &path) const {
  std::lock_guard<std::mutex> lk(mu_);
  return fs_.count(resolve("/", path)) > 0;
}

void FakeRemoteBackend::script(const std::string &command, ExecResult result) {
  std::lock_guard<std::mutex> lk(mu_);
  scripted_[command] = std::move(result);
}

void FakeRemoteBackend::set_password(const std::string &password) {
  std::lock_guard<std::mutex> lk(mu_);
  password_ = password;
}

void FakeRemoteBackend::drop_connection() {
  std::lock_guard<std::mutex> lk(mu_);
  dropped_ = true;
}

void FakeRemoteBackend::fail_next(ErrorCode code, const std::string &message) {
  std::lock_guard<std::mutex> lk(mu_);
  next_error_ = Error(code, message);
}

std::vector<FakeRemoteBackend::Call> FakeRemoteBackend::exec_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exec_calls_;
}

int FakeRemoteBackend::list_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return list_calls_;
}

int FakeRemoteBackend::realpath_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return realpath_calls_;
}

int FakeRemoteBackend::connect_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connect_calls_;
}

bool FakeRemoteBackend::sftp_open() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sftp_;
}

} // namespace visionsync
