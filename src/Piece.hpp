#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstdint>
#include <functional>
#include <string_view>

#include <boost/integer.hpp>
#include <fmt/format.h>

#include "Edge.hpp"

enum class Direction : uint8_t { North, East, South, West };

constexpr inline Direction opposite(Direction d) {
    return static_cast<Direction>((static_cast<uint8_t>(d) + 2u) % 4u);
}

class Piece {
public:
    // [MSB] north east south west [LSB]
    // so that integer order is lexicographic order over the edges
    using piece_t = boost::uint_t<32>::least;

private:
    piece_t value;

    friend std::hash<Piece>;

public:
    // empty cell
    constexpr Piece() : value{} { }

    explicit constexpr Piece(piece_t v) : value{ v } { }

    constexpr Piece(Edge n, Edge e, Edge s, Edge w)
        : value{ static_cast<piece_t>(
                piece_t{ static_cast<uint8_t>(n) } << 24u |
                piece_t{ static_cast<uint8_t>(e) } << 16u |
                piece_t{ static_cast<uint8_t>(s) } << 8u  |
                piece_t{ static_cast<uint8_t>(w) }) } { }

    // "NESW", e.g. "EAGB"; throws InvalidPieceError
    explicit Piece(std::string_view sv);

    constexpr Piece(const Piece &v) = default;
    constexpr Piece(Piece &&v) noexcept = default;
    constexpr Piece &operator=(const Piece &v) noexcept = default;
    constexpr Piece &operator=(Piece &&v) noexcept = default;

    constexpr explicit operator bool() const { return value; }
    constexpr bool operator==(const Piece &other) const = default;
    constexpr auto operator<=>(const Piece &other) const = default;

    [[nodiscard]] constexpr Edge edge(Direction d) const {
        auto shift = 24u - 8u * static_cast<unsigned>(d);
        return static_cast<Edge>((value >> shift) & 0xffu);
    }

    [[nodiscard]] constexpr Edge north() const { return edge(Direction::North); }
    [[nodiscard]] constexpr Edge east() const { return edge(Direction::East); }
    [[nodiscard]] constexpr Edge south() const { return edge(Direction::South); }
    [[nodiscard]] constexpr Edge west() const { return edge(Direction::West); }

    // (n, e, s, w) => (e, s, w, n)
    [[nodiscard]] constexpr Piece rotate() const {
        return Piece{ static_cast<piece_t>(std::rotl(static_cast<uint32_t>(value), 8)) };
    }

    // (n, e, s, w) => (n, w, s, e)
    [[nodiscard]] constexpr Piece flip() const {
        return Piece{ static_cast<piece_t>((value & 0xff00ff00u)
                | (value & 0x000000ffu) << 16u
                | (value >> 16u & 0x000000ffu)) };
    }

    // [0..3] = rotations of *this
    // [4..7] = rotations of flip()
    // duplicates are kept
    [[nodiscard]] constexpr std::array<Piece, 8> orientations() const {
        std::array<Piece, 8> res{};
        res[0] = *this;
        for (auto i = 1zu; i < 4; i++)
            res[i] = res[i - 1].rotate();
        res[4] = flip();
        for (auto i = 5zu; i < 8; i++)
            res[i] = res[i - 1].rotate();
        return res;
    }

    // lexicographically smallest orientation
    [[nodiscard]] Piece canonical_form() const;
};

template <>
struct fmt::formatter<Piece> : formatter<string_view> {
    auto format(Piece c, format_context &ctx) const
        -> format_context::iterator;
};

template <>
struct std::hash<Piece> {
    constexpr size_t operator()(Piece p) const noexcept {
        return p.value;
    }
};
