#pragma once
/*
 * FileWatcher
 *
 * Watch mode: every Create/Modify event for a regular file that is neither an
 * editor artifact nor excluded goes straight to the FileProcessor as a real
 * run. Events are handled one at a time, in arrival order.
 */
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

#include "ghostscrub/change_notifier.hpp"
#include "ghostscrub/file_processor.hpp"

namespace ghostscrub {

class FileWatcher {
public:
    static constexpr std::chrono::milliseconds kReceiveTimeout{100};

    FileWatcher(const FileProcessor& processor, ChangeNotifier& notifier);

    // Registers every root, then loops until `stop` is set. Fatal notifier
    // failures propagate as ScrubError(WatchSetup); per-file errors do not.
    void run(const std::vector<std::filesystem::path>& roots, const std::atomic<bool>& stop);

    // Returns the number of files cleaned by this event.
    std::size_t handle_event(const WatchEvent& event);

private:
    bool wants(const std::filesystem::path& path) const;

    const FileProcessor& processor_;
    const Console& console_;
    ChangeNotifier& notifier_;
};

} // namespace ghostscrub
