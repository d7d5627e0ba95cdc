#include "ghostscrub/file_processor.hpp"

#include "ghostscrub/diff_view.hpp"
#include "ghostscrub/text_file.hpp"

namespace fs = std::filesystem;

namespace ghostscrub {

const char* process_result_name(ProcessResult::Kind kind) {
    switch (kind) {
        case ProcessResult::Kind::Cleaned:   return "cleaned";
        case ProcessResult::Kind::DryRun:    return "dry-run";
        case ProcessResult::Kind::NoChanges: return "no changes";
        case ProcessResult::Kind::Skipped:   return "skipped";
    }
    return "unknown";
}

FileProcessor::FileProcessor(const Configuration& config, const Console& console)
    : config_(config), console_(console), filter_(config), cleaner_(config.target_characters) {}

ProcessResult FileProcessor::process(const fs::path& path, bool dry_run, bool verbose) const {
    if (!filter_.should_process(path)) {
        return ProcessResult::skipped();
    }

    const std::string content = read_text_file(path);
    const std::string cleaned = cleaner_.clean(content);

    if (content == cleaned) {
        console_.detail("No changes needed: " + path.string());
        return ProcessResult::no_changes();
    }

    const std::size_t changes = count_changes(content, cleaned);

    if (verbose) {
        console_.out() << render_diff_report(path.string(), content, cleaned, changes, dry_run) << std::flush;
    }

    if (dry_run) {
        if (!verbose) {
            console_.log("Would clean " + std::to_string(changes) + " invisible characters from: " + path.string());
        }
        return ProcessResult::dry_run(changes);
    }

    write_text_file(path, cleaned);
    if (!verbose) {
        console_.status("Cleaned " + std::to_string(changes) + " invisible characters from: " + path.string());
    }
    return ProcessResult::cleaned(changes);
}

} // namespace ghostscrub
