#include "ghostscrub/inotify_notifier.hpp"

#include <cerrno>
#include <cstring>      // For std::strerror, std::memcpy
#include <utility>      // For std::move

#include <poll.h>
#include <sys/inotify.h>

#include "ghostscrub/scrub_error.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE | IN_DELETE_SELF;

} // namespace

WatchEvent::Kind InotifyNotifier::event_kind(uint32_t mask) {
    if (mask & IN_Q_OVERFLOW) return WatchEvent::Kind::Warning;
    if (mask & (IN_CREATE | IN_MOVED_TO)) return WatchEvent::Kind::Create;
    if (mask & IN_CLOSE_WRITE) return WatchEvent::Kind::Modify;
    return WatchEvent::Kind::Other;
}

InotifyNotifier::InotifyNotifier() : fd_(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC)) {
    if (!fd_.valid()) {
        throw ScrubError(ErrorKind::WatchSetup, std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
}

int InotifyNotifier::add_watch(const fs::path& dir) {
    const int wd = ::inotify_add_watch(fd_.get(), dir.c_str(), kWatchMask);
    if (wd < 0) {
        throw ScrubError(ErrorKind::WatchSetup, std::string("cannot watch directory: ") + std::strerror(errno),
                         dir.string());
    }
    return wd;
}

void InotifyNotifier::add_directory(const fs::path& dir) {
    WatchedDir& watched = dirs_[add_watch(dir)];
    watched.dir = dir;
    watched.only.clear();
}

void InotifyNotifier::add_tree(const fs::path& root) {
    add_directory(root);
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ScrubError(ErrorKind::WatchSetup, "cannot read directory: " + ec.message(), root.string());
    }
    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code status_ec;
        if (it->is_symlink(status_ec)) {
            if (it->is_directory(status_ec)) it.disable_recursion_pending();
            continue;
        }
        if (it->is_directory(status_ec)) add_directory(it->path());
    }
    if (ec) {
        throw ScrubError(ErrorKind::WatchSetup, "cannot read directory: " + ec.message(), root.string());
    }
}

void InotifyNotifier::add_file(const fs::path& file, const fs::path& reported) {
    const fs::path parent = file.has_parent_path() ? file.parent_path() : fs::path(".");
    const std::string name = file.filename().string();
    const int wd = add_watch(parent);

    auto existing = dirs_.find(wd);
    if (existing == dirs_.end()) {
        WatchedDir watched;
        watched.dir = parent;
        watched.only.emplace(name, reported);
        dirs_.emplace(wd, std::move(watched));
    } else if (!existing->second.only.empty()) {
        existing->second.only.emplace(name, reported);
    }
    // Otherwise the whole directory is already watched.
}

void InotifyNotifier::watch(const fs::path& root) {
    std::error_code ec;
    if (fs::is_directory(root, ec)) {
        add_tree(root);
    } else if (fs::exists(root, ec)) {
        if (fs::is_symlink(root, ec)) {
            // Write-back replaces the link target, so watch where it lives.
            const fs::path target = fs::canonical(root, ec);
            if (ec) {
                throw ScrubError(ErrorKind::WatchSetup, "cannot resolve link: " + ec.message(), root.string());
            }
            add_file(target, root);
        } else {
            add_file(root, root);
        }
    } else {
        throw ScrubError(ErrorKind::WatchSetup, "no such file or directory", root.string());
    }
}

void InotifyNotifier::watch_new_directory(const fs::path& dir) {
    try {
        add_tree(dir);
    } catch (const ScrubError& e) {
        std::error_code ec;
        if (!fs::exists(dir, ec)) return; // removed again before we got to it
        push_warning("Could not watch new directory " + dir.string() + ": " + e.what());
    }
}

void InotifyNotifier::push_warning(std::string message) {
    WatchEvent event;
    event.kind = WatchEvent::Kind::Warning;
    event.message = std::move(message);
    pending_.push_back(std::move(event));
}

void InotifyNotifier::drain() {
    alignas(struct inotify_event) char buffer[64 * 1024];
    for (;;) {
        const ssize_t len = ::read(fd_.get(), buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw ScrubError(ErrorKind::WatchSetup, std::string("reading inotify events failed: ") + std::strerror(errno));
        }
        if (len == 0) return;

        for (ssize_t offset = 0; offset < len;) {
            struct inotify_event ev;
            std::memcpy(&ev, buffer + offset, sizeof(ev));
            const std::string name = ev.len > 0 ? std::string(buffer + offset + sizeof(struct inotify_event)) : "";
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + ev.len);

            if (ev.mask & IN_Q_OVERFLOW) {
                push_warning("Too many file changes at once; some were missed.");
                continue;
            }
            if (ev.mask & IN_IGNORED) {
                dirs_.erase(ev.wd);
                continue;
            }
            auto found = dirs_.find(ev.wd);
            if (found == dirs_.end()) continue;

            // Copies: watching a new directory below may rehash dirs_.
            fs::path path;
            const bool recursive = found->second.only.empty();
            if (recursive) {
                path = name.empty() ? found->second.dir : found->second.dir / name;
            } else {
                auto file = found->second.only.find(name);
                if (file == found->second.only.end()) continue;
                path = file->second;
            }

            WatchEvent event;
            event.kind = event_kind(ev.mask);
            event.paths.push_back(path);
            pending_.push_back(std::move(event));

            if (recursive && (ev.mask & (IN_CREATE | IN_MOVED_TO)) && (ev.mask & IN_ISDIR)) {
                watch_new_directory(path);
            }
        }
    }
}

std::optional<WatchEvent> InotifyNotifier::next_event(std::chrono::milliseconds timeout) {
    if (pending_.empty()) {
        struct pollfd pfd{};
        pfd.fd = fd_.get();
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) return std::nullopt;
            throw ScrubError(ErrorKind::WatchSetup, std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready > 0) drain();
    }
    if (pending_.empty()) return std::nullopt;

    WatchEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

} // namespace ghostscrub
