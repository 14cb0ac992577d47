#include <chrono>
#include <cstdio>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <mimalloc-new-delete.h>

#include <fmt/format.h>

#include "board.hpp"
#include "known.hpp"
#include "Library.hpp"
#include "Solver.hpp"
#include "util.hpp"

namespace {

struct Options {
    Order order{ Order::DepthFirst };
    std::optional<size_t> rows, cols;
    uint64_t interval{ 10000 };
    uint64_t limit{};
    bool quiet{};
    std::optional<std::string> path;
};

void usage(const char *argv0) {
    fmt::print("Usage: {} [--dfs | --bfs] [--rows N] [--cols N] [--progress N] [--limit N]\n"
               "       [--quiet] [INVENTORY_FILE]\n"
               "\n"
               "  --dfs          depth-first exploration (default)\n"
               "  --bfs          breadth-first exploration\n"
               "  --rows N       board rows (default 4)\n"
               "  --cols N       board columns (default 4)\n"
               "  --progress N   report progress every N layouts, 0 = never (default 10000)\n"
               "  --limit N      stop after N solutions, 0 = all (default 0)\n"
               "  --quiet        only print the summary\n"
               "\n"
               "Without INVENTORY_FILE the 16 pieces of The Ultimate Puzzle are used.\n",
               argv0);
}

// std::nullopt if the program should exit right away
std::optional<Options> parse_args(int argc, char **argv) {
    Options opt;
    for (auto i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--dfs") {
            opt.order = Order::DepthFirst;
        } else if (arg == "--bfs") {
            opt.order = Order::BreadthFirst;
        } else if (arg == "--rows") {
            opt.rows = parse_u64(require_arg(i, argc, argv, arg));
        } else if (arg == "--cols") {
            opt.cols = parse_u64(require_arg(i, argc, argv, arg));
        } else if (arg == "--progress") {
            opt.interval = parse_u64(require_arg(i, argc, argv, arg));
        } else if (arg == "--limit") {
            opt.limit = parse_u64(require_arg(i, argc, argv, arg));
        } else if (arg == "--quiet" || arg == "-q") {
            opt.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return std::nullopt;
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::runtime_error{ fmt::format("unknown argument {}", arg) };
        } else if (opt.path) {
            throw std::runtime_error{ fmt::format("more than one inventory file: {}", arg) };
        } else {
            opt.path = arg;
        }
    }
    return opt;
}

class PrintingSolver : public Solver {
    bool quiet;

public:
    PrintingSolver(Board board, Pool pool, Order order, uint64_t interval, bool q)
        : Solver{ std::move(board), std::move(pool), order, interval }, quiet{ q } { }

protected:
    void progress(const Snapshot &s) override {
        if (quiet)
            return;
        fmt::print("Layouts explored: {}\n", s.explored);
        fmt::print("Layouts queued: {} (peak {})\n", s.queued, s.peak);
        fmt::print("Best solution found so far:\n{}", s.best.board);
        fmt::print("{}\n\n", s.best.pool);
        std::fflush(stdout);
    }
};

} // namespace

int main(int argc, char **argv) {
    try {
        auto opt = parse_args(argc, argv);
        if (!opt)
            return 0;

        auto lib = opt->path ? Library::from_file(*opt->path) : known_library();
        Board board{ opt->rows.value_or(known_rows), opt->cols.value_or(known_cols) };
        auto pool = lib.pool();

        fmt::print("Starting {} search...\n", opt->order);
        fmt::print("{}", board);
        fmt::print("{}\n", pool);
        if (pool.size() != board.size())
            fmt::print("Warning: {} pieces for {} cells, no layout can use all of them\n",
                    pool.size(), board.size());

        PrintingSolver solver{ board, pool, opt->order, opt->interval, opt->quiet };

        auto t1 = std::chrono::steady_clock::now();
        auto elapsed = [&] {
            auto t2 = std::chrono::steady_clock::now();
            return std::chrono::duration<double>(t2 - t1).count();
        };
        auto n_solutions = 0ull;
        for (auto &sol : solver) {
            n_solutions++;
            if (!opt->quiet) {
                auto s = elapsed();
                fmt::print("Found solutions: {}\n", n_solutions);
                fmt::print("Solutions per second: {:.2f}\n", rate(n_solutions, s));
                fmt::print("Layouts explored: {}\n", sol.explored);
                fmt::print("Layouts per second: {:.2f}\n", rate(sol.explored, s));
                fmt::print("Layouts queued: {}\n", sol.queued);
                fmt::print("{}\n", sol.board);
                std::fflush(stdout);
            }
            if (opt->limit && n_solutions == opt->limit)
                break;
        }

        auto s = elapsed();
        fmt::print("{} solutions, {} layouts explored in {:.3f}s ({:.2f}/s), peak queue {}\n",
                n_solutions, solver.get_explored(), s, rate(solver.get_explored(), s),
                solver.get_peak());
        if (solver.exhausted())
            fmt::print("Search exhausted: {} solutions in total\n", n_solutions);
        else
            fmt::print("Search stopped early, {} layouts still queued\n", solver.get_queued());
    } catch (const std::exception &ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }
    return 0;
}
