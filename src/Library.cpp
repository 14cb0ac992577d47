#include "Library.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

Library::Library(std::initializer_list<std::string_view> lst) {
    for (auto sv : lst)
        push(sv);
}

void Library::push(Piece p) {
    if (!p)
        throw InvalidPieceError{ "empty piece in library" };
    for (auto d : { Direction::North, Direction::East, Direction::South, Direction::West })
        if (auto ch = static_cast<char>(p.edge(d)); !valid_edge(ch))
            throw InvalidPieceError{ fmt::format("invalid edge symbol 0x{:02x} in library",
                    static_cast<uint8_t>(ch)) };
    lib.push_back(p.canonical_form());
}

void Library::push(std::string_view sv) {
    push(Piece{ sv });
}

Pool Library::pool() const {
    auto res = lib;
    std::sort(res.begin(), res.end());
    return res;
}

Library Library::parse(std::string_view txt) {
    Library res;
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == ',';
    };
    while (!txt.empty()) {
        if (txt.front() == '#') {
            auto eol = txt.find('\n');
            txt.remove_prefix(eol == std::string_view::npos ? txt.size() : eol);
            continue;
        }
        if (is_space(txt.front())) {
            txt.remove_prefix(1);
            continue;
        }
        auto len = 0zu;
        while (len < txt.size() && !is_space(txt[len]) && txt[len] != '#')
            len++;
        res.push(txt.substr(0, len));
        txt.remove_prefix(len);
    }
    return res;
}

Library Library::from_file(const std::filesystem::path &path) {
    std::ifstream fin(path);
    if (!fin)
        throw std::runtime_error{ fmt::format("cannot open inventory file {}", path.string()) };
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return parse(buffer.str());
}

Pool without(const Pool &pool, size_t id) {
    Pool res;
    res.reserve(pool.size() - 1);
    res.insert(res.end(), pool.begin(), pool.begin() + id);
    res.insert(res.end(), pool.begin() + id + 1, pool.end());
    return res;
}

auto fmt::formatter<Pool>::format(const Pool &c, format_context &ctx) const
    -> format_context::iterator {
    std::string txt{ "[" };
    for (auto it = c.begin(); it != c.end(); ++it) {
        if (it != c.begin())
            txt += ", ";
        txt += fmt::format("{}", *it);
    }
    txt.push_back(']');
    return formatter<string_view>::format(txt, ctx);
}
