#include "Edge.hpp"

static_assert(mate(Edge::A) == Edge::B);
static_assert(mate(Edge::B) == Edge::A);
static_assert(mate(Edge::C) == Edge::D);
static_assert(mate(Edge::D) == Edge::C);
static_assert(mate(Edge::E) == Edge::F);
static_assert(mate(Edge::F) == Edge::E);
static_assert(mate(Edge::G) == Edge::H);
static_assert(mate(Edge::H) == Edge::G);

static_assert(mate(mate(Edge::A)) == Edge::A);
static_assert(mate(mate(Edge::D)) == Edge::D);
static_assert(mate(mate(Edge::E)) == Edge::E);
static_assert(mate(mate(Edge::H)) == Edge::H);

static_assert(matches(Edge::G, Edge::H) && matches(Edge::H, Edge::G));
static_assert(!matches(Edge::A, Edge::A));
static_assert(!matches(Edge::B, Edge::C));

static_assert(valid_edge('A') && valid_edge('H'));
static_assert(!valid_edge('I') && !valid_edge('a') && !valid_edge('_'));

auto fmt::formatter<Edge>::format(Edge e, format_context &ctx) const
    -> format_context::iterator {
    char ch = static_cast<char>(e);
    return formatter<string_view>::format(string_view{ &ch, 1 }, ctx);
}
