#include "ghostscrub/file_watcher.hpp"

#include <string>

#include "ghostscrub/path_filter.hpp"
#include "ghostscrub/scrub_error.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

FileWatcher::FileWatcher(const FileProcessor& processor, ChangeNotifier& notifier)
    : processor_(processor), console_(processor.console()), notifier_(notifier) {}

void FileWatcher::run(const std::vector<fs::path>& roots, const std::atomic<bool>& stop) {
    for (const auto& root : roots) {
        console_.log("Watching: " + root.string());
        notifier_.watch(root);
    }
    console_.log("File watcher started. Press Ctrl+C to stop.");

    while (!stop.load()) {
        auto event = notifier_.next_event(kReceiveTimeout);
        if (!event) continue;
        handle_event(*event);
    }
}

bool FileWatcher::wants(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    if (is_editor_artifact(path)) return false;
    return !processor_.filter().is_excluded(path);
}

std::size_t FileWatcher::handle_event(const WatchEvent& event) {
    if (event.kind == WatchEvent::Kind::Warning) {
        console_.warning("Warning: " + event.message);
        return 0;
    }
    if (event.kind == WatchEvent::Kind::Other) return 0;

    std::size_t cleaned = 0;
    for (const auto& path : event.paths) {
        if (!wants(path)) continue;
        try {
            const ProcessResult result = processor_.process(path, false, false);
            if (result.kind == ProcessResult::Kind::Cleaned) {
                console_.log("Auto-cleaned " + std::to_string(result.changes) +
                             " invisible characters from: " + path.string());
                ++cleaned;
            }
        } catch (const ScrubError& e) {
            console_.error("Error processing " + path.string() + ": " + e.what());
        } catch (const fs::filesystem_error& e) {
            console_.error("Error processing " + path.string() + ": " + e.what());
        }
    }
    return cleaned;
}

} // namespace ghostscrub
