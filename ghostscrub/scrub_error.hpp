#pragma once

#include <stdexcept>    // For std::runtime_error
#include <string>
#include <utility>

namespace ghostscrub {

// What went wrong. Config and watch-setup errors abort the invocation,
// everything else is recorded per file and the run continues.
enum class ErrorKind {
    ConfigParse,
    ConfigIo,
    FileRead,
    FileDecode,
    FileWrite,
    GlobSyntax,
    WatchSetup
};

class ScrubError : public std::runtime_error {
public:
    ScrubError(ErrorKind kind, const std::string& message, std::string path = std::string())
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

    // Fatal kinds stop the whole run (bad config, no watch).
    bool is_fatal() const {
        return kind_ == ErrorKind::ConfigParse || kind_ == ErrorKind::ConfigIo ||
               kind_ == ErrorKind::WatchSetup;
    }

private:
    ErrorKind kind_;
    std::string path_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigParse: return "config parse error";
        case ErrorKind::ConfigIo:    return "config I/O error";
        case ErrorKind::FileRead:    return "read error";
        case ErrorKind::FileDecode:  return "decode error";
        case ErrorKind::FileWrite:   return "write error";
        case ErrorKind::GlobSyntax:  return "glob syntax error";
        case ErrorKind::WatchSetup:  return "watch setup error";
    }
    return "error";
}

} // namespace ghostscrub
