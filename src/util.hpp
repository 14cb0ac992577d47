#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

// per second, 0 before the clock has moved
inline double rate(uint64_t n, double s) {
    return s > 0.0 ? n / s : 0.0;
}

inline std::string require_arg(int &i, int argc, char **argv, const std::string &flag) {
    if (i + 1 >= argc)
        throw std::runtime_error{ fmt::format("missing value for {}", flag) };
    return argv[++i];
}

inline uint64_t parse_u64(const std::string &s) {
    size_t pos = 0;
    uint64_t v;
    try {
        v = std::stoull(s, &pos);
    } catch (const std::logic_error &) {
        throw std::runtime_error{ fmt::format("invalid number: {}", s) };
    }
    if (pos != s.size() || s.front() == '-')
        throw std::runtime_error{ fmt::format("invalid number: {}", s) };
    return v;
}
