#pragma once

#include <ostream>
#include <string>

namespace applog {

// record severity; larger values are more severe.
// values between the named levels are permitted.

enum class severity: int {
    debug = 10,
    info = 20,
    warning = 30,
    error = 40,
    critical = 50
};

inline bool operator<(severity a, severity b) {
    return static_cast<int>(a)<static_cast<int>(b);
}
inline bool operator>(severity a, severity b) { return b<a; }
inline bool operator<=(severity a, severity b) { return !(b<a); }
inline bool operator>=(severity a, severity b) { return !(a<b); }

// upper-case level name, e.g. "INFO"; unnamed values render as "Level <n>"
std::string level_name(severity lev);

// parse a level name (case-insensitive) or decimal value;
// throws std::invalid_argument on unrecognized text
severity parse_severity(const std::string& text);

inline std::ostream& operator<<(std::ostream& out, severity lev) {
    return out << level_name(lev);
}

} // namespace applog
