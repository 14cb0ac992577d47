#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string_view>

#include <boost/container/small_vector.hpp>
#include <fmt/format.h>

#include "Piece.hpp"

// canonical forms of the pieces not yet placed
using Pool = boost::container::small_vector<Piece, 16zu>;

// the inventory: every input piece normalized to its canonical form;
// two descriptions of the same physical piece stay two entries
class Library {
    Pool lib;

public:
    Library() = default;
    // throws InvalidPieceError
    Library(std::initializer_list<std::string_view> lst);

    void push(Piece p);
    void push(std::string_view sv);

    [[nodiscard]] size_t size() const { return lib.size(); }
    [[nodiscard]] bool empty() const { return lib.empty(); }

    // sorted, ready to seed a search
    [[nodiscard]] Pool pool() const;

    // whitespace separated descriptions, '#' comments until end of line
    static Library parse(std::string_view txt);
    static Library from_file(const std::filesystem::path &path);
};

// removes pool[id], keeping the order of the rest
[[nodiscard]] Pool without(const Pool &pool, size_t id);

template <>
struct fmt::formatter<Pool> : formatter<string_view> {
    auto format(const Pool &c, format_context &ctx) const
        -> format_context::iterator;
};
