#include "remote_viewmodel.hpp"
#include "visionsync/errors.hpp"

#include <algorithm>
#include <cctype>

namespace visionsync_gui {

static std::string lower(std::string s) {
  for (auto &c : s)
    c = (char)std::tolower((unsigned char)c);
  return s;
}

RemoteViewModel::RemoteViewModel(visionsync::RemoteSession *session)
    : session_(session) {}

std::string RemoteViewModel::normalize(const std::string &path) {
  std::string p = path;
  while (p.size() > 1 && p.back() == '/')
    p.pop_back();
  return p.empty() ? "/" : p;
}

std::string RemoteViewModel::child_path(const std::string &name) const {
  if (!name.empty() && name[0] == '/')
    return name;
  if (current_path_.empty())
    return name;
  if (current_path_ == "/")
    return "/" + name;
  return current_path_ + "/" + name;
}

bool RemoteViewModel::connect(const visionsync::HostConfiguration &host) {
  error_.clear();
  if (!session_->connect(host)) {
    error_ = session_->last_error();
    return false;
  }
  history_pos_ = session_->history().size();
  return open_directory(session_->current_directory());
}

void RemoteViewModel::disconnect() {
  session_->disconnect();
  current_path_.clear();
  entries_.clear();
  expanded_ = {"/"};
}

bool RemoteViewModel::open_directory(const std::string &path) {
  try {
    entries_ = session_->list_directory(path);
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    return false;
  }
  if (!entries_.empty()) {
    // child paths are canonical
    const auto &p = entries_.front().path;
    auto slash = p.rfind('/');
    current_path_ = slash == 0 ? "/" : p.substr(0, slash);
  } else if (path.empty()) {
    current_path_ = session_->current_directory();
  } else if (path[0] == '/' || current_path_.empty()) {
    current_path_ = normalize(path);
  } else {
    current_path_ = normalize(child_path(path));
  }
  expand_path_to_directory(current_path_);
  error_.clear();
  return true;
}

bool RemoteViewModel::open_parent() {
  if (current_path_.empty() || current_path_ == "/")
    return false;
  auto slash = current_path_.rfind('/');
  return open_directory(slash == 0 ? "/" : current_path_.substr(0, slash));
}

bool RemoteViewModel::reload() {
  if (current_path_.empty())
    return false;
  try {
    entries_ = session_->refresh_directory(current_path_);
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    return false;
  }
  return true;
}

std::vector<visionsync::RemoteFile> RemoteViewModel::visible_files() const {
  const std::string needle = lower(search_);
  std::vector<visionsync::RemoteFile> out;
  for (const auto &f : entries_) {
    if (!show_hidden_ && f.is_hidden())
      continue;
    if (!needle.empty() && lower(f.name).find(needle) == std::string::npos)
      continue;
    out.push_back(f);
  }

  const SortOrder order = sort_;
  std::stable_sort(out.begin(), out.end(),
                   [order](const visionsync::RemoteFile &a,
                           const visionsync::RemoteFile &b) {
                     if (a.is_directory != b.is_directory)
                       return a.is_directory;
                     switch (order) {
                     case SortOrder::Size:
                       return a.size < b.size;
                     case SortOrder::Date:
                       return a.modified > b.modified;
                     case SortOrder::Name:
                       break;
                     }
                     return lower(a.name) < lower(b.name);
                   });
  return out;
}

void RemoteViewModel::toggle_expanded(const std::string &path) {
  const std::string p = normalize(path);
  if (!expanded_.erase(p))
    expanded_.insert(p);
}

bool RemoteViewModel::is_expanded(const std::string &path) const {
  return expanded_.count(normalize(path)) > 0;
}

void RemoteViewModel::expand_path_to_directory(const std::string &path) {
  const std::string p = normalize(path);
  expanded_.insert("/");
  size_t pos = 1;
  while (pos <= p.size()) {
    size_t next = p.find('/', pos);
    if (next == std::string::npos)
      next = p.size();
    if (next > 1)
      expanded_.insert(p.substr(0, next));
    pos = next + 1;
  }
}

bool RemoteViewModel::delete_file(const visionsync::RemoteFile &file) {
  try {
    session_->delete_file(file);
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    return false;
  }
  return reload();
}

bool RemoteViewModel::upload(const std::string &name, const std::string &data) {
  try {
    session_->write_file(child_path(name), data);
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    return false;
  }
  return reload();
}

std::optional<std::string> RemoteViewModel::preview(const std::string &path) {
  try {
    return session_->read_file(path);
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    return std::nullopt;
  }
}

bool RemoteViewModel::submit(const std::string &command) {
  bool ok = true;
  try {
    session_->execute_command(command);
    error_.clear();
  } catch (const visionsync::Error &e) {
    error_ = e.what();
    ok = false;
  }
  history_pos_ = session_->history().size();
  return ok;
}

std::optional<std::string> RemoteViewModel::history_up() {
  const auto &h = session_->history();
  if (h.empty() || history_pos_ == 0)
    return std::nullopt;
  if (history_pos_ > h.size())
    history_pos_ = h.size();
  --history_pos_;
  return h[history_pos_];
}

std::optional<std::string> RemoteViewModel::history_down() {
  const auto &h = session_->history();
  if (history_pos_ >= h.size())
    return std::nullopt;
  ++history_pos_;
  if (history_pos_ == h.size())
    return std::string();
  return h[history_pos_];
}

std::string RemoteViewModel::prompt() const {
  const auto &host = session_->host();
  std::string who = host ? host->username + "@" + host->hostname : "";
  return who + ":" + session_->current_directory() + "$ ";
}

} // namespace visionsync_gui
