#pragma once
/*
 * Whole-file text I/O.
 *
 * read_text_file  : reads everything, rejects content that is not UTF-8.
 * write_text_file : safe write (temp sibling -> fdatasync -> atomic rename),
 *                   keeps the original permission bits.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <unistd.h>

namespace ghostscrub {

// Owns a POSIX file descriptor.
class UniqueFd {
public:
    UniqueFd() : fd_(-1) {}
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
        return *this;
    }
    ~UniqueFd() { close_if_needed(); }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1) { close_if_needed(); fd_ = fd; }

private:
    void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
    int fd_;
};

// Throws ScrubError(FileRead) if the file cannot be read and
// ScrubError(FileDecode) if it is not valid UTF-8.
std::string read_text_file(const std::filesystem::path& path);

// Throws ScrubError(FileWrite); on failure the original file is untouched and
// the temporary file is removed.
void write_text_file(const std::filesystem::path& path, std::string_view content);

} // namespace ghostscrub
