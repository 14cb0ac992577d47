#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

#include "board.hpp"
#include "Frontier.hpp"
#include "Library.hpp"

struct State {
    Board board;
    Pool pool;
};

struct Solution {
    Board board;
    uint64_t explored; // states generated so far, this one included
    size_t queued;     // frontier size at emission
};

struct Snapshot {
    uint64_t explored;
    size_t queued, peak;
    const State &best; // fewest pieces left, latest on ties
};

// Enumerates every completion of the root state.
// next() suspends right after a solution is generated and resumes
// in the middle of the same expansion, so the sequence of solutions
// and counters does not depend on how often the caller pulls.
// NOT thread-safe
class Solver {
    State root;
    Frontier<State> frontier;
    uint64_t interval;

    // expansion in progress
    std::optional<State> current;
    coords_t pos;
    size_t piece_id, trs_id;
    std::array<Piece, 8> trs;

    State best;
    uint64_t explored;
    size_t peak;

public:
    // interval: a Snapshot is reported every interval explored states, 0 = never
    Solver(Board board, Pool pool, Order order = Order::DepthFirst, uint64_t interval = 10000);
    virtual ~Solver() { }

    // std::nullopt once the frontier is exhausted
    [[nodiscard]] std::optional<Solution> next();

    // back to the root state, counters cleared
    void reset();

    // true iff every reachable state has been expanded
    [[nodiscard]] bool exhausted() const {
        return !current && frontier.empty();
    }

    [[nodiscard]] uint64_t get_explored() const { return explored; }
    [[nodiscard]] size_t get_queued() const { return frontier.size(); }
    [[nodiscard]] size_t get_peak() const { return peak; }
    [[nodiscard]] const State &get_best() const { return best; }

    struct iterator {
        using iterator_category = std::input_iterator_tag;
        using value_type = Solution;
        using difference_type = std::ptrdiff_t;
        using pointer = const Solution *;
        using reference = const Solution &;

        Solver *solver;
        std::optional<Solution> sol;

        reference operator*() const { return *sol; }
        pointer operator->() const { return &*sol; }
        iterator &operator++() {
            sol = solver->next();
            return *this;
        }
        void operator++(int) { ++*this; }
        bool operator==(std::default_sentinel_t) const { return !sol; }
    };

    // continues from where the last next() stopped
    iterator begin() { return iterator{ this, next() }; }
    std::default_sentinel_t end() const { return {}; }

protected:
    virtual void progress(const Snapshot &s) { }
};
