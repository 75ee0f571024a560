#pragma once
#include "visionsync/remote_session.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace visionsync_gui {

enum class SortOrder { Name, Size, Date };

// File browser and terminal over one remote session. Not thread-safe; the
// UI drives it from one thread.
class RemoteViewModel {
public:
  explicit RemoteViewModel(visionsync::RemoteSession *session);

  bool connect(const visionsync::HostConfiguration &host);
  void disconnect();

  // File browser
  bool open_directory(const std::string &path);
  bool open_parent();
  bool reload();
  const std::string &current_path() const { return current_path_; }
  // Entries of the open directory after the hidden/search filters, sorted
  // directories first.
  std::vector<visionsync::RemoteFile> visible_files() const;

  void set_show_hidden(bool show) { show_hidden_ = show; }
  bool show_hidden() const { return show_hidden_; }
  void set_search(const std::string &text) { search_ = text; }
  void set_sort(SortOrder order) { sort_ = order; }
  SortOrder sort() const { return sort_; }

  void toggle_expanded(const std::string &path);
  bool is_expanded(const std::string &path) const;
  // Marks "/" and every ancestor of `path`, and `path` itself, expanded.
  void expand_path_to_directory(const std::string &path);
  const std::set<std::string> &expanded() const { return expanded_; }

  bool delete_file(const visionsync::RemoteFile &file);
  bool upload(const std::string &name, const std::string &data);
  std::optional<std::string> preview(const std::string &path);

  // Terminal
  bool submit(const std::string &command);
  // Older entry, or nullopt with nothing older.
  std::optional<std::string> history_up();
  // Newer entry; past the newest returns an empty input line.
  std::optional<std::string> history_down();
  std::string terminal_text() const { return session_->output_text(); }
  std::string prompt() const;

  std::string error() const { return error_; }

private:
  visionsync::RemoteSession *session_;
  std::string current_path_;
  std::vector<visionsync::RemoteFile> entries_;
  std::set<std::string> expanded_ = {"/"};
  bool show_hidden_ = false;
  std::string search_;
  SortOrder sort_ = SortOrder::Name;
  size_t history_pos_ = 0;
  std::string error_;

  static std::string normalize(const std::string &path);
  std::string child_path(const std::string &name) const;
};

} // namespace visionsync_gui
