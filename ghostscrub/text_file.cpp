#include "ghostscrub/text_file.hpp"

#include <cerrno>
#include <cstdint>      // For std::uintmax_t
#include <cstdlib>      // For mkstemp
#include <cstring>      // For std::strerror
#include <fstream>
#include <limits>       // For std::numeric_limits
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

#include "ghostscrub/scrub_error.hpp"
#include "ghostscrub/unicode_utils.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

std::string read_text_file(const fs::path& path) {
    std::ifstream infile(path, std::ios::binary); // binary: keep \r\n and exact byte counts
    if (!infile.is_open()) {
        throw ScrubError(ErrorKind::FileRead, "could not open file", path.string());
    }

    std::string content;
    infile.seekg(0, std::ios::end);
    const std::streampos end_pos = infile.tellg();
    infile.seekg(0, std::ios::beg);
    const std::streampos beg_pos = infile.tellg();

    if (end_pos == static_cast<std::streampos>(-1) || beg_pos == static_cast<std::streampos>(-1)) {
        throw ScrubError(ErrorKind::FileRead, "could not determine file size", path.string());
    }
    if (end_pos > beg_pos) {
        const auto file_size = static_cast<std::uintmax_t>(end_pos - beg_pos);
        if (file_size > std::numeric_limits<std::size_t>::max()) {
            throw ScrubError(ErrorKind::FileRead, "file is too large to load", path.string());
        }
        content.resize(static_cast<std::size_t>(file_size));
        infile.read(&content[0], static_cast<std::streamsize>(content.size()));
        if (static_cast<std::size_t>(infile.gcount()) != content.size()) {
            throw ScrubError(ErrorKind::FileRead, "short read", path.string());
        }
    }

    if (!unicode::is_valid_utf8(content)) {
        throw ScrubError(ErrorKind::FileDecode, "stream did not contain valid UTF-8", path.string());
    }
    return content;
}

void write_text_file(const fs::path& link_or_path, std::string_view content) {
    // Replace the file a symlink points at, not the link itself.
    fs::path path = link_or_path;
    std::error_code link_ec;
    if (fs::is_symlink(link_or_path, link_ec)) {
        path = fs::canonical(link_or_path, link_ec);
        if (link_ec) {
            throw ScrubError(ErrorKind::FileWrite, "could not resolve symlink: " + link_ec.message(),
                             link_or_path.string());
        }
    }

    // Refuse read-only files even though the rename below would get around it.
    if (::access(path.c_str(), W_OK) != 0 && errno != ENOENT) {
        throw ScrubError(ErrorKind::FileWrite, std::string("not writable: ") + std::strerror(errno), path.string());
    }

    struct stat st{};
    const bool have_mode = ::stat(path.c_str(), &st) == 0;

    // Hidden sibling in the same directory so the rename stays on one filesystem.
    const fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    const std::string tmpl = (dir / ("." + path.filename().string() + ".ghostscrub-XXXXXX")).string();
    std::vector<char> tmp_name(tmpl.begin(), tmpl.end());
    tmp_name.push_back('\0');

    UniqueFd ufd(::mkstemp(tmp_name.data()));
    if (!ufd.valid()) {
        throw ScrubError(ErrorKind::FileWrite,
                         std::string("could not create temporary file: ") + std::strerror(errno), path.string());
    }
    const std::string tmp(tmp_name.data());

    auto fail = [&](const std::string& what) {
        const std::string reason = what + ": " + std::strerror(errno);
        ufd.reset();
        ::unlink(tmp.c_str());
        throw ScrubError(ErrorKind::FileWrite, reason, path.string());
    };

    if (have_mode && ::fchmod(ufd.get(), st.st_mode & 07777) != 0) fail("could not copy file mode");

    const char* p = content.data();
    std::size_t remain = content.size();
    while (remain > 0) {
        const ssize_t w = ::write(ufd.get(), p, remain);
        if (w < 0) {
            if (errno == EINTR) continue;
            fail("write failed");
        }
        p += w;
        remain -= static_cast<std::size_t>(w);
    }

#if defined(__APPLE__)
    if (::fsync(ufd.get()) != 0) fail("sync failed");
#else
    if (::fdatasync(ufd.get()) != 0) fail("sync failed");
#endif
    ufd.reset();

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const std::string reason = std::string("rename failed: ") + std::strerror(errno);
        ::unlink(tmp.c_str());
        throw ScrubError(ErrorKind::FileWrite, reason, path.string());
    }
}

} // namespace ghostscrub
