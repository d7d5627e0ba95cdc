#pragma once
/*
 * Console
 *
 * Where every component reports to. Holds the stdout/stderr streams and the
 * configured verbosity, so that tests can swap in string streams.
 */
#include <iostream>
#include <string>

namespace ghostscrub {

enum class Verbosity { Silent, Normal, Verbose };

class Console {
public:
    Console(Verbosity verbosity = Verbosity::Normal,
            std::ostream& out = std::cout,
            std::ostream& err = std::cerr)
        : verbosity_(verbosity), out_(&out), err_(&err) {}

    Verbosity verbosity() const { return verbosity_; }
    void set_verbosity(Verbosity verbosity) { verbosity_ = verbosity; }

    bool is_silent() const { return verbosity_ == Verbosity::Silent; }
    bool is_verbose() const { return verbosity_ == Verbosity::Verbose; }

    // Always printed (summaries, dry-run notices, diff reports).
    void log(const std::string& message) const;
    // Suppressed at silent verbosity.
    void status(const std::string& message) const;
    // Printed only at verbose verbosity.
    void detail(const std::string& message) const;
    // Errors and warnings go to the error stream regardless of verbosity.
    // Messages carry their own "Error:" / "Warning:" prefix.
    void error(const std::string& message) const;
    void warning(const std::string& message) const;

    std::ostream& out() const { return *out_; }

private:
    Verbosity verbosity_;
    std::ostream* out_;
    std::ostream* err_;
};

} // namespace ghostscrub
