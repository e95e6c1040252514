#include "util.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    if (v < INT_MIN || v > INT_MAX) return std::nullopt;
    return (int)v;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    using namespace std::chrono;
    return duration<double>(steady_clock::now() - start).count();
}
