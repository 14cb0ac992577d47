#include "Piece.hpp"

#include <algorithm>
#include <ranges>

static_assert(Piece{ Edge::A, Edge::B, Edge::C, Edge::D }.rotate()
        == Piece{ Edge::B, Edge::C, Edge::D, Edge::A });
static_assert(Piece{ Edge::A, Edge::B, Edge::C, Edge::D }.flip()
        == Piece{ Edge::A, Edge::D, Edge::C, Edge::B });
static_assert(Piece{ Edge::E, Edge::A, Edge::G, Edge::B }.west() == Edge::B);
static_assert(Piece{ Edge::A, Edge::H, Edge::A, Edge::A } > Piece{ Edge::A, Edge::A, Edge::H, Edge::H });
static_assert(opposite(Direction::North) == Direction::South);
static_assert(opposite(Direction::West) == Direction::East);

Piece::Piece(std::string_view sv) : value{} {
    if (sv.size() != 4)
        throw InvalidPieceError{ fmt::format("piece '{}' must have exactly 4 edges", sv) };
    for (auto ch : sv)
        value = static_cast<piece_t>(value << 8u | static_cast<uint8_t>(to_edge(ch)));
}

Piece Piece::canonical_form() const {
    return std::ranges::min(orientations(), std::less{}, &Piece::value);
}

auto fmt::formatter<Piece>::format(Piece c, format_context &ctx) const
    -> format_context::iterator {
    if (!c)
        return formatter<string_view>::format("_", ctx);
    char txt[4];
    for (auto d : { Direction::North, Direction::East, Direction::South, Direction::West })
        txt[static_cast<size_t>(d)] = static_cast<char>(c.edge(d));
    return formatter<string_view>::format(string_view{ txt, 4 }, ctx);
}
