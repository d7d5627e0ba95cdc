#pragma once
/*
 * InotifyNotifier
 *
 * Linux inotify backend for ChangeNotifier. One watch descriptor per
 * directory; directories created under a watched root are added as their
 * IN_CREATE arrives, so the watch stays recursive.
 *
 * A file root is watched through its parent directory with a name filter.
 * Write-back replaces the file by rename, and a watch on the file's own
 * inode would die with the first replacement.
 *
 *   IN_CREATE, IN_MOVED_TO -> Create
 *   IN_CLOSE_WRITE         -> Modify
 *   IN_Q_OVERFLOW          -> Warning
 *   anything else          -> Other
 */
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>

#include "ghostscrub/change_notifier.hpp"
#include "ghostscrub/text_file.hpp"

namespace ghostscrub {

class InotifyNotifier : public ChangeNotifier {
public:
    InotifyNotifier();

    void watch(const std::filesystem::path& root) override;
    std::optional<WatchEvent> next_event(std::chrono::milliseconds timeout) override;

    static WatchEvent::Kind event_kind(std::uint32_t mask);

private:
    struct WatchedDir {
        std::filesystem::path dir;
        // File roots in this directory, by name, with the path to report.
        // Empty: every entry, recursively.
        std::map<std::string, std::filesystem::path> only;
    };

    int add_watch(const std::filesystem::path& dir);
    void add_directory(const std::filesystem::path& dir);
    void add_tree(const std::filesystem::path& root);
    void add_file(const std::filesystem::path& file, const std::filesystem::path& reported);
    void watch_new_directory(const std::filesystem::path& dir);
    void push_warning(std::string message);
    void drain();

    UniqueFd fd_;
    std::unordered_map<int, WatchedDir> dirs_; // watch descriptor -> directory
    std::deque<WatchEvent> pending_;
};

} // namespace ghostscrub
