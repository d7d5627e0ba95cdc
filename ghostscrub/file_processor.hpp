#pragma once
/*
 * FileProcessor
 *
 * read -> clean -> (write | report) for one file.
 * Errors surface as ScrubError (FileRead, FileDecode, FileWrite); callers
 * decide whether they are fatal.
 */
#include <cstddef>
#include <filesystem>

#include "ghostscrub/char_cleaner.hpp"
#include "ghostscrub/console.hpp"
#include "ghostscrub/path_filter.hpp"
#include "ghostscrub/scrub_config.hpp"

namespace ghostscrub {

struct ProcessResult {
    enum class Kind { Cleaned, DryRun, NoChanges, Skipped };

    Kind kind = Kind::NoChanges;
    std::size_t changes = 0; // meaningful for Cleaned and DryRun

    static ProcessResult cleaned(std::size_t n) { return {Kind::Cleaned, n}; }
    static ProcessResult dry_run(std::size_t n) { return {Kind::DryRun, n}; }
    static ProcessResult no_changes() { return {Kind::NoChanges, 0}; }
    static ProcessResult skipped() { return {Kind::Skipped, 0}; }

    bool operator==(const ProcessResult& other) const {
        return kind == other.kind && changes == other.changes;
    }
    bool operator!=(const ProcessResult& other) const { return !(*this == other); }
};

const char* process_result_name(ProcessResult::Kind kind);

class FileProcessor {
public:
    // `config` and `console` must outlive the processor.
    FileProcessor(const Configuration& config, const Console& console);

    ProcessResult process(const std::filesystem::path& path, bool dry_run, bool verbose) const;

    const PathFilter& filter() const { return filter_; }
    const Configuration& config() const { return config_; }
    const Console& console() const { return console_; }

private:
    const Configuration& config_;
    const Console& console_;
    PathFilter filter_;
    CharCleaner cleaner_;
};

} // namespace ghostscrub
