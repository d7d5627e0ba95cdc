#pragma once
/*
 * TreeWalker
 *
 * Expands command-line paths (files, directories, glob patterns) into files,
 * hands each to the FileProcessor and adds up the outcomes. A failing file or
 * unreadable directory is reported, counted and skipped; the walk goes on.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ghostscrub/console.hpp"
#include "ghostscrub/file_processor.hpp"

namespace ghostscrub {

struct WalkResult {
    std::size_t files_processed = 0;
    std::size_t files_skipped = 0;
    std::size_t total_changes = 0;
    std::size_t errors = 0;

    void record(const ProcessResult& result);
    WalkResult& operator+=(const WalkResult& other);

    // Summary block printed at the end of a run; wording depends on dry_run.
    std::string summary(bool dry_run) const;
    void print_summary(const Console& console, bool dry_run) const;
};

class TreeWalker {
public:
    explicit TreeWalker(const FileProcessor& processor);

    WalkResult process_paths(const std::vector<std::filesystem::path>& paths, bool dry_run, bool verbose) const;

private:
    void process_file(const std::filesystem::path& path, bool dry_run, bool verbose, WalkResult& result) const;
    void walk_directory(const std::filesystem::path& dir, bool dry_run, bool verbose, WalkResult& result) const;
    void process_glob(const std::string& pattern, bool dry_run, bool verbose, WalkResult& result) const;

    const FileProcessor& processor_;
    const Console& console_;
};

} // namespace ghostscrub
