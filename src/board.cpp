#include "board.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

Board::Board(size_t r, size_t c) : rows{ r }, cols{ c }, filled{} {
    if (!rows || !cols)
        throw std::invalid_argument{ fmt::format("invalid board shape {}x{}", rows, cols) };
    if (rows > std::numeric_limits<size_t>::max() / cols)
        throw std::invalid_argument{ fmt::format("board shape {}x{} is too large", rows, cols) };
    cells.resize(rows * cols);
}

std::optional<coords_t> Board::front() const {
    auto it = std::find_if(cells.begin(), cells.end(), [](Piece p) { return !p; });
    if (it == cells.end())
        return std::nullopt;
    auto id = static_cast<size_t>(it - cells.begin());
    return coords_t{ id / cols, id % cols };
}

Piece Board::neighbor(coords_t pos, Direction d) const {
    auto [row, col] = pos;
    switch (d) {
        case Direction::North: return row == 0 ? Piece{} : at(row - 1, col);
        case Direction::East: return col + 1 == cols ? Piece{} : at(row, col + 1);
        case Direction::South: return row + 1 == rows ? Piece{} : at(row + 1, col);
        case Direction::West: return col == 0 ? Piece{} : at(row, col - 1);
    }
    return Piece{};
}

bool Board::fits(Piece p, coords_t pos) const {
    for (auto d : { Direction::North, Direction::East, Direction::South, Direction::West }) {
        auto nb = neighbor(pos, d);
        if (nb && !matches(p.edge(d), nb.edge(opposite(d))))
            return false;
    }
    return true;
}

Board Board::place(Piece p, coords_t pos) const {
    auto res = *this;
    auto &cell = res.cells[pos.first * cols + pos.second];
    if (!cell)
        res.filled++;
    cell = p;
    return res;
}

auto fmt::formatter<Board>::format(const Board &c, format_context &ctx) const
    -> format_context::iterator {
    std::string txt;
    for (auto row = 0zu; row < c.get_rows(); row++) {
        for (auto col = 0zu; col < c.get_cols(); col++) {
            if (col)
                txt.push_back(' ');
            txt += fmt::format("{:>4}", c.at(row, col));
        }
        txt.push_back('\n');
    }
    return formatter<string_view>::format(txt, ctx);
}
