#include "ghostscrub/console.hpp"

namespace ghostscrub {

void Console::log(const std::string& message) const {
    *out_ << message << std::endl;
}

void Console::status(const std::string& message) const {
    if (!is_silent()) *out_ << message << std::endl;
}

void Console::detail(const std::string& message) const {
    if (is_verbose()) *out_ << message << std::endl;
}

void Console::error(const std::string& message) const {
    *err_ << message << std::endl;
}

void Console::warning(const std::string& message) const {
    *err_ << message << std::endl;
}

} // namespace ghostscrub
