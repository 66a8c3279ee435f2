#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <applog/severity.hpp>

namespace applog {

namespace {

struct level_name_entry {
    severity level;
    const char* name;
};

const level_name_entry level_names[] = {
    {severity::debug, "DEBUG"},
    {severity::info, "INFO"},
    {severity::warning, "WARNING"},
    {severity::error, "ERROR"},
    {severity::critical, "CRITICAL"}
};

} // anonymous namespace

std::string level_name(severity lev) {
    for (const auto& e: level_names) {
        if (e.level==lev) return e.name;
    }
    return "Level "+std::to_string(static_cast<int>(lev));
}

severity parse_severity(const std::string& text) {
    std::string upper;
    for (char c: text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    for (const auto& e: level_names) {
        if (upper==e.name) return e.level;
    }
    if (upper=="WARN") return severity::warning;

    if (!text.empty()) {
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(text.c_str(), &end, 10);
        if (end && *end=='\0') {
            if (errno==ERANGE || value<INT_MIN || value>INT_MAX) {
                throw std::invalid_argument("log level out of range: '"+text+"'");
            }
            return static_cast<severity>(value);
        }
    }

    throw std::invalid_argument("unrecognized log level: '"+text+"'");
}

} // namespace applog
