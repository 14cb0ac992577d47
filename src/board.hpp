#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include <boost/container/small_vector.hpp>
#include <fmt/format.h>

#include "Piece.hpp"

using coords_t = std::pair<size_t, size_t>; // Y, X

// rows x cols cells, row-major
// a Board is a value: place() never modifies *this
class Board {
    using cells_t = boost::container::small_vector<Piece, 16zu>;

    size_t rows, cols, filled;
    cells_t cells;

public:
    Board(size_t r, size_t c);

    Board(const Board &v) = default;
    Board(Board &&v) noexcept = default;
    Board &operator=(const Board &v) = default;
    Board &operator=(Board &&v) noexcept = default;
    bool operator==(const Board &other) const = default;

    [[nodiscard]] size_t get_rows() const { return rows; }
    [[nodiscard]] size_t get_cols() const { return cols; }
    [[nodiscard]] size_t size() const { return rows * cols; }
    [[nodiscard]] size_t count() const { return filled; }
    [[nodiscard]] bool full() const { return filled == size(); }

    [[nodiscard]] Piece at(size_t row, size_t col) const {
        return cells[row * cols + col];
    }
    [[nodiscard]] Piece at(coords_t pos) const {
        return at(pos.first, pos.second);
    }

    // first empty cell in row-major order
    [[nodiscard]] std::optional<coords_t> front() const;

    // edges touching already placed neighbors must be mates;
    // the grid boundary and empty neighbors always match
    [[nodiscard]] bool fits(Piece p, coords_t pos) const;

    [[nodiscard]] Board place(Piece p, coords_t pos) const;

private:
    // the in-grid neighbor of pos towards d, empty if none
    [[nodiscard]] Piece neighbor(coords_t pos, Direction d) const;
};

template <>
struct fmt::formatter<Board> : formatter<string_view> {
    auto format(const Board &c, format_context &ctx) const
        -> format_context::iterator;
};
