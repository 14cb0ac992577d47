#include "Solver.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

Solver::Solver(Board board, Pool pool, Order order, uint64_t intv)
    : root{ std::move(board), std::move(pool) },
      frontier{ order },
      interval{ intv },
      pos{}, piece_id{}, trs_id{}, trs{},
      best{ root },
      explored{}, peak{} {
    reset();
}

void Solver::reset() {
    frontier.clear();
    frontier.push(root);
    current.reset();
    pos = {};
    piece_id = trs_id = 0;
    best = root;
    explored = 0;
    peak = frontier.size();
}

std::optional<Solution> Solver::next() {
    while (true) {
        if (!current) {
            if (frontier.empty())
                return std::nullopt;
            current.emplace(frontier.pop());
            auto f = current->board.front();
            if (!f)
                throw std::logic_error{ "Solver: expanding a board without empty cells" };
            pos = *f;
            piece_id = trs_id = 0;
        }

        // every orientation of every remaining piece at the first empty cell
        while (piece_id < current->pool.size()) {
            if (!trs_id)
                trs = current->pool[piece_id].orientations();
            auto id = piece_id;
            auto p = trs[trs_id];
            if (++trs_id == trs.size())
                trs_id = 0, piece_id++;

            if (!current->board.fits(p, pos))
                continue;

            State child{ current->board.place(p, pos), without(current->pool, id) };
            explored++;

            if (child.pool.empty())
                return Solution{ std::move(child.board), explored, frontier.size() };

            // more pieces than cells: nothing left to expand
            if (child.board.full())
                continue;

            if (child.pool.size() <= best.pool.size())
                best = child;
            frontier.push(std::move(child));
            peak = std::max(peak, frontier.size());

            if (interval && explored % interval == 0)
                progress(Snapshot{ explored, frontier.size(), peak, best });
        }
        current.reset();
    }
}
