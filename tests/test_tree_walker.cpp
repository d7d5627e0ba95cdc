#include <catch2/catch.hpp>

#include <sstream>

#include "ghostscrub/tree_walker.hpp"
#include "test_support.hpp"

using namespace ghostscrub;
namespace fs = std::filesystem;

namespace {

struct WalkerFixture {
    test::TempDir tmp;
    Configuration config = Configuration::defaults();
    std::ostringstream out;
    std::ostringstream err;
    Console console{Verbosity::Normal, out, err};

    WalkResult walk(const std::vector<fs::path>& paths, bool dry_run) {
        FileProcessor processor(config, console);
        TreeWalker walker(processor);
        return walker.process_paths(paths, dry_run, false);
    }
};

} // namespace

TEST_CASE("Walking a directory") {
    WalkerFixture fx;
    const fs::path root = fx.tmp.path();
    test::write_file(root / "clean.txt", "fine\n");
    test::write_file(root / "dirty.md", "title  \n\xE2\x80\x8B\n");
    test::write_file(root / "src" / "main.cpp", "int main() {}\t\n");
    test::write_file(root / "image.png", "binary\xFF");
    test::write_file(root / "node_modules" / "lib" / "index.js", "junk   \n");
    test::write_file(root / ".git" / "HEAD", "ref: x  \n");
    test::write_file(root / "server.log", "log line  \n");

    const WalkResult result = fx.walk({root}, false);

    REQUIRE(result.files_processed == 3);
    REQUIRE(result.files_skipped == 1);
    REQUIRE(result.total_changes == 6);
    REQUIRE(result.errors == 0);

    REQUIRE(test::read_file(root / "dirty.md") == "title\n\n");
    REQUIRE(test::read_file(root / "src" / "main.cpp") == "int main() {}\n");
    // Excluded entries are not entered.
    REQUIRE(test::read_file(root / "node_modules" / "lib" / "index.js") == "junk   \n");
    REQUIRE(test::read_file(root / ".git" / "HEAD") == "ref: x  \n");
    REQUIRE(test::read_file(root / "server.log") == "log line  \n");
    REQUIRE(fx.err.str().empty());
}

TEST_CASE("One bad file does not stop the walk") {
    WalkerFixture fx;
    const fs::path root = fx.tmp.path();
    for (int i = 1; i <= 4; ++i) {
        test::write_file(root / ("file" + std::to_string(i) + ".txt"), "ok\n");
    }
    test::write_file(root / "file5.txt", std::string("\xFF\xFE\x00\x01", 4));

    const WalkResult result = fx.walk({root}, false);

    REQUIRE(result.files_processed == 4);
    REQUIRE(result.errors == 1);
    REQUIRE(fx.err.str().find("Error processing " + (root / "file5.txt").string() + ": ") == 0);
}

TEST_CASE("Unreadable file among readable ones") {
    if (::geteuid() == 0) {
        WARN("skipped: permissions do not apply when running as root");
        return;
    }
    WalkerFixture fx;
    const fs::path root = fx.tmp.path();
    for (int i = 1; i <= 5; ++i) {
        test::write_file(root / ("file" + std::to_string(i) + ".txt"), "text \n");
    }
    fs::permissions(root / "file3.txt", fs::perms::none);

    const WalkResult result = fx.walk({root}, false);
    fs::permissions(root / "file3.txt", fs::perms::owner_all);

    REQUIRE(result.files_processed == 4);
    REQUIRE(result.errors == 1);
    REQUIRE(result.total_changes == 4);
}

TEST_CASE("Dry run never mutates") {
    WalkerFixture fx;
    const fs::path root = fx.tmp.path();
    const std::string a = "one\xC2\xA0two  \n\n   \n";
    const std::string b = "\xEF\xBB\xBFheader\r\nbody\x07\n";
    test::write_file(root / "a.txt", a);
    test::write_file(root / "nested" / "b.py", b);

    const WalkResult dry = fx.walk({root}, true);
    REQUIRE(test::read_file(root / "a.txt") == a);
    REQUIRE(test::read_file(root / "nested" / "b.py") == b);
    REQUIRE(dry.files_processed == 2);
    REQUIRE(fx.out.str().find("Would clean") != std::string::npos);

    const WalkResult real = fx.walk({root}, false);
    REQUIRE(real.total_changes == dry.total_changes);
    REQUIRE(real.files_processed == dry.files_processed);
    REQUIRE(test::read_file(root / "a.txt") != a);
}

TEST_CASE("Command-line paths") {
    WalkerFixture fx;
    const fs::path root = fx.tmp.path();
    test::write_file(root / "a.txt", "a \n");
    test::write_file(root / "b.txt", "b \n");
    test::write_file(root / "c.md", "c \n");
    test::write_file(root / "sub" / "d.txt", "d \n");

    SECTION("Explicit file outside the exclude patterns' reach") {
        const fs::path log = root / "debug.log";
        fx.config.include_extensions.push_back("log");
        test::write_file(log, "entry \n");
        const WalkResult result = fx.walk({log}, false);
        REQUIRE(result.files_processed == 1);
        REQUIRE(test::read_file(log) == "entry\n");
    }

    SECTION("Glob pattern") {
        const WalkResult result = fx.walk({root / "*.txt"}, false);
        REQUIRE(result.files_processed == 2);
        REQUIRE(result.total_changes == 2);
        REQUIRE(test::read_file(root / "c.md") == "c \n");
        REQUIRE(test::read_file(root / "sub" / "d.txt") == "d \n");
    }

    SECTION("Glob matching a directory and its files counts each file once") {
        const WalkResult result = fx.walk({root / "**"}, false);
        REQUIRE(result.files_processed == 4);
        REQUIRE(result.total_changes == 4);
    }

    SECTION("Glob without matches") {
        const WalkResult result = fx.walk({root / "*.rs"}, false);
        REQUIRE(result.files_processed == 0);
        REQUIRE(result.errors == 0);
        REQUIRE(fx.err.str().find("Warning: No files match") == 0);
    }

    SECTION("Malformed glob is counted as an error") {
        const WalkResult result = fx.walk({root / "[oops", root / "a.txt"}, false);
        REQUIRE(result.errors == 1);
        REQUIRE(result.files_processed == 1);
        REQUIRE(fx.err.str().find("Glob error: ") == 0);
    }

    SECTION("Several paths add up") {
        const WalkResult result = fx.walk({root / "a.txt", root / "sub"}, true);
        REQUIRE(result.files_processed == 2);
        REQUIRE(result.total_changes == 2);
    }
}

TEST_CASE("Run summary") {
    WalkResult result;
    result.record(ProcessResult::cleaned(3));
    result.record(ProcessResult::no_changes());
    result.record(ProcessResult::dry_run(4));
    result.record(ProcessResult::skipped());
    REQUIRE(result.files_processed == 3);
    REQUIRE(result.files_skipped == 1);
    REQUIRE(result.total_changes == 7);

    SECTION("Real run") {
        result.errors = 2;
        REQUIRE(result.summary(false) ==
                "Processing summary:\n"
                "  Files processed: 3\n"
                "  Invisible characters removed: 7\n"
                "  Files skipped: 1\n"
                "  Errors encountered: 2\n");
    }

    SECTION("Dry run without skips or errors") {
        WalkResult clean;
        clean.record(ProcessResult::dry_run(5));
        REQUIRE(clean.summary(true) ==
                "Dry run summary:\n"
                "  Files that would be processed: 1\n"
                "  Invisible characters that would be removed: 5\n");
    }

    SECTION("Printed after a blank line") {
        std::ostringstream out;
        std::ostringstream err;
        Console console(Verbosity::Silent, out, err);
        result.print_summary(console, false);
        REQUIRE(out.str() == "\n" + result.summary(false));
    }

    SECTION("Accumulation") {
        WalkResult other;
        other.errors = 1;
        other.record(ProcessResult::cleaned(1));
        result += other;
        REQUIRE(result.files_processed == 4);
        REQUIRE(result.total_changes == 8);
        REQUIRE(result.errors == 1);
    }
}
