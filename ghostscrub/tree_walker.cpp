#include "ghostscrub/tree_walker.hpp"

#include <algorithm>    // For std::sort, std::mismatch
#include <sstream>

#include "ghostscrub/glob_pattern.hpp"
#include "ghostscrub/scrub_error.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

void WalkResult::record(const ProcessResult& result) {
    switch (result.kind) {
        case ProcessResult::Kind::Cleaned:
        case ProcessResult::Kind::DryRun:
            ++files_processed;
            total_changes += result.changes;
            break;
        case ProcessResult::Kind::NoChanges:
            ++files_processed;
            break;
        case ProcessResult::Kind::Skipped:
            ++files_skipped;
            break;
    }
}

WalkResult& WalkResult::operator+=(const WalkResult& other) {
    files_processed += other.files_processed;
    files_skipped += other.files_skipped;
    total_changes += other.total_changes;
    errors += other.errors;
    return *this;
}

std::string WalkResult::summary(bool dry_run) const {
    std::ostringstream ss;
    if (dry_run) {
        ss << "Dry run summary:\n";
        ss << "  Files that would be processed: " << files_processed << '\n';
        ss << "  Invisible characters that would be removed: " << total_changes << '\n';
    } else {
        ss << "Processing summary:\n";
        ss << "  Files processed: " << files_processed << '\n';
        ss << "  Invisible characters removed: " << total_changes << '\n';
    }
    if (files_skipped > 0) ss << "  Files skipped: " << files_skipped << '\n';
    if (errors > 0) ss << "  Errors encountered: " << errors << '\n';
    return ss.str();
}

void WalkResult::print_summary(const Console& console, bool dry_run) const {
    console.out() << '\n' << summary(dry_run) << std::flush;
}

TreeWalker::TreeWalker(const FileProcessor& processor)
    : processor_(processor), console_(processor.console()) {}

WalkResult TreeWalker::process_paths(const std::vector<fs::path>& paths, bool dry_run, bool verbose) const {
    WalkResult result;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            process_file(path, dry_run, verbose, result);
        } else if (fs::is_directory(path, ec)) {
            walk_directory(path, dry_run, verbose, result);
        } else {
            // Not on disk: treat the argument as a glob pattern.
            process_glob(path.string(), dry_run, verbose, result);
        }
    }
    return result;
}

void TreeWalker::process_file(const fs::path& path, bool dry_run, bool verbose, WalkResult& result) const {
    try {
        result.record(processor_.process(path, dry_run, verbose));
    } catch (const ScrubError& e) {
        console_.error("Error processing " + path.string() + ": " + e.what());
        ++result.errors;
    } catch (const fs::filesystem_error& e) {
        console_.error("Error processing " + path.string() + ": " + e.what());
        ++result.errors;
    }
}

void TreeWalker::walk_directory(const fs::path& dir, bool dry_run, bool verbose, WalkResult& result) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        console_.error("Error reading directory " + dir.string() + ": " + ec.message());
        ++result.errors;
        return;
    }

    // Collect first so the visiting order does not depend on the filesystem.
    std::vector<fs::directory_entry> entries;
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    if (ec) {
        console_.error("Error reading directory " + dir.string() + ": " + ec.message());
        ++result.errors;
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        const fs::path& path = entry.path();
        // Excluded entries are neither entered nor counted.
        if (processor_.filter().is_excluded(path)) continue;

        std::error_code status_ec;
        if (entry.is_directory(status_ec)) {
            // Symlinked directories are not followed (no cycles).
            if (entry.is_symlink(status_ec)) continue;
            walk_directory(path, dry_run, verbose, result);
        } else if (entry.is_regular_file(status_ec)) {
            process_file(path, dry_run, verbose, result);
        }
    }
}

void TreeWalker::process_glob(const std::string& pattern, bool dry_run, bool verbose, WalkResult& result) const {
    GlobExpansion expansion;
    try {
        expansion = expand_glob(pattern);
    } catch (const ScrubError& e) {
        console_.error(std::string("Glob error: ") + e.what());
        ++result.errors;
        return;
    }

    for (const auto& message : expansion.errors) {
        console_.error("Glob error: " + message);
        ++result.errors;
    }
    if (expansion.matches.empty() && expansion.errors.empty()) {
        console_.warning("Warning: No files match '" + pattern + "'");
        return;
    }

    // Matches are sorted, so a directory comes before anything inside it.
    // Whatever lies below an already walked directory has been handled.
    std::vector<fs::path> walked;
    auto inside_walked = [&walked](const fs::path& candidate) {
        for (const auto& dir : walked) {
            auto mismatch = std::mismatch(dir.begin(), dir.end(), candidate.begin(), candidate.end());
            if (mismatch.first == dir.end()) return true;
        }
        return false;
    };

    for (const auto& match : expansion.matches) {
        if (inside_walked(match)) continue;
        std::error_code ec;
        if (fs::is_regular_file(match, ec)) {
            process_file(match, dry_run, verbose, result);
        } else if (fs::is_directory(match, ec)) {
            walk_directory(match, dry_run, verbose, result);
            walked.push_back(match);
        }
    }
}

} // namespace ghostscrub
