#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + flag);
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("invalid integer: " + s);
    }
    return v;
}

// Integer in [lo, hi]; names the flag on failure.
inline int parse_int_in(const std::string& flag, const std::string& s, int lo, int hi) {
    const int v = parse_int(s);
    if (v < lo || v > hi) {
        throw std::runtime_error(flag + " must be in [" + std::to_string(lo) + "," + std::to_string(hi) + "]");
    }
    return v;
}

inline uint64_t parse_u64(const std::string& s) {
    if (!s.empty() && s[0] == '-') {
        throw std::runtime_error("invalid uint64: " + s);
    }
    size_t pos = 0;
    uint64_t v = std::stoull(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("invalid uint64: " + s);
    }
    return v;
}
