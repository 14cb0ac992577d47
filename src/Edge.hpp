#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

// A = cross   B = cross socket
// C = circle  D = circle socket
// E = tree    F = tree socket
// G = boat    H = boat socket
enum class Edge : uint8_t {
    A = 'A', B = 'B',
    C = 'C', D = 'D',
    E = 'E', F = 'F',
    G = 'G', H = 'H',
};

struct InvalidPieceError : std::invalid_argument {
    explicit InvalidPieceError(const std::string &what)
        : std::invalid_argument{ what } { }
};

constexpr inline bool valid_edge(char ch) {
    return ch >= 'A' && ch <= 'H';
}

// the pairing is total and involutive: mate(mate(e)) == e
constexpr inline Edge mate(Edge e) {
    auto v = static_cast<uint8_t>(e) - uint8_t{ 'A' };
    return static_cast<Edge>('A' + (v ^ 1u));
}

constexpr inline bool matches(Edge lhs, Edge rhs) {
    return mate(lhs) == rhs;
}

inline Edge to_edge(char ch) {
    if (!valid_edge(ch))
        throw InvalidPieceError{ fmt::format("invalid edge symbol '{}'", ch) };
    return static_cast<Edge>(ch);
}

template <>
struct fmt::formatter<Edge> : formatter<string_view> {
    auto format(Edge e, format_context &ctx) const
        -> format_context::iterator;
};
