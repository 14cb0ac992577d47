#pragma once

#include <cstddef>
#include <deque>
#include <utility>

#include <fmt/format.h>

enum class Order { DepthFirst, BreadthFirst };

// states always leave from the back;
// DepthFirst pushes to the back (stack), BreadthFirst to the front (queue)
template <typename T>
class Frontier {
    std::deque<T> q;
    Order order;

public:
    explicit Frontier(Order o) : order{ o } { }

    [[nodiscard]] Order get_order() const { return order; }
    [[nodiscard]] size_t size() const { return q.size(); }
    [[nodiscard]] bool empty() const { return q.empty(); }

    void push(T v) {
        if (order == Order::DepthFirst)
            q.push_back(std::move(v));
        else
            q.push_front(std::move(v));
    }

    [[nodiscard]] T pop() {
        auto v = std::move(q.back());
        q.pop_back();
        return v;
    }

    void clear() { q.clear(); }
};

template <>
struct fmt::formatter<Order> : formatter<string_view> {
    auto format(Order c, format_context &ctx) const
        -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case Order::DepthFirst: name = "depth-first"; break;
            case Order::BreadthFirst: name = "breadth-first"; break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};
