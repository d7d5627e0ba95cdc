#pragma once
/*
 * ChangeNotifier
 *
 * Source of filesystem change events for watch mode. The kernel-backed
 * implementation lives in inotify_notifier; tests feed scripted events.
 */
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ghostscrub {

struct WatchEvent {
    // Warning carries no paths worth processing, only a message for the user.
    enum class Kind { Create, Modify, Other, Warning };

    Kind kind = Kind::Other;
    std::vector<std::filesystem::path> paths;
    std::string message;
};

class ChangeNotifier {
public:
    virtual ~ChangeNotifier() = default;

    // Watches `root` and everything below it; a file root is watched on its
    // own. Throws ScrubError(WatchSetup).
    virtual void watch(const std::filesystem::path& root) = 0;

    // Waits up to `timeout` for the next event; std::nullopt on timeout.
    virtual std::optional<WatchEvent> next_event(std::chrono::milliseconds timeout) = 0;
};

} // namespace ghostscrub
