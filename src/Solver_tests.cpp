#include "Solver.hpp"
#include "known.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

// exactly one tiling up to rotating / mirroring the whole board
Library unique_library() {
    return Library{ "GCBA", "CBGF", "EBHH", "FCDF" };
}

Board make_board(std::initializer_list<std::initializer_list<const char *>> rows) {
    Board b{ rows.size(), rows.begin()->size() };
    auto r = 0zu;
    for (auto &row : rows) {
        auto c = 0zu;
        for (auto sv : row) {
            if (std::string{ sv } != "_")
                b = b.place(Piece{ sv }, { r, c });
            c++;
        }
        r++;
    }
    return b;
}

std::vector<Solution> collect(Solver &s) {
    std::vector<Solution> res;
    while (auto sol = s.next())
        res.push_back(std::move(*sol));
    return res;
}

std::multiset<std::string> boards_of(const std::vector<Solution> &sols) {
    std::multiset<std::string> res;
    for (auto &sol : sols)
        res.insert(fmt::format("{}", sol.board));
    return res;
}

// every touching pair of edges mates
bool valid_tiling(const Board &b) {
    if (!b.full())
        return false;
    for (auto row = 0zu; row < b.get_rows(); row++)
        for (auto col = 0zu; col < b.get_cols(); col++) {
            if (col + 1 < b.get_cols() && !matches(b.at(row, col).east(), b.at(row, col + 1).west()))
                return false;
            if (row + 1 < b.get_rows() && !matches(b.at(row, col).south(), b.at(row + 1, col).north()))
                return false;
        }
    return true;
}

// square boards only
Board rotate_cw(const Board &b) {
    auto n = b.get_rows();
    Board res{ n, n };
    for (auto row = 0zu; row < n; row++)
        for (auto col = 0zu; col < n; col++)
            res = res.place(b.at(row, col).rotate().rotate().rotate(), { col, n - 1 - row });
    return res;
}

Board mirror(const Board &b) {
    Board res{ b.get_rows(), b.get_cols() };
    for (auto row = 0zu; row < b.get_rows(); row++)
        for (auto col = 0zu; col < b.get_cols(); col++)
            res = res.place(b.at(row, col).flip(), { row, b.get_cols() - 1 - col });
    return res;
}

struct RecordingSolver : Solver {
    struct Record {
        uint64_t explored;
        size_t queued, peak, left;
        std::string best;
    };
    std::vector<Record> records;

    using Solver::Solver;

protected:
    void progress(const Snapshot &s) override {
        records.push_back(Record{ s.explored, s.queued, s.peak, s.best.pool.size(),
                fmt::format("{}", s.best.board) });
    }
};

} // namespace

TEST(Solver, depthFirstTrace) {
    Solver s{ Board{ 2, 2 }, unique_library().pool(), Order::DepthFirst };
    auto first = s.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->board, make_board({ { "FFDC", "BHHE" }, { "CBGF", "GCBA" } }));
    EXPECT_EQ(first->explored, 43u);
    EXPECT_EQ(first->queued, 33u);

    auto rest = collect(s);
    ASSERT_EQ(rest.size(), 7u);
    EXPECT_EQ(rest.back().board, make_board({ { "CGAB", "HBEH" }, { "BCFG", "FFCD" } }));
    EXPECT_EQ(rest.back().explored, 284u);
    EXPECT_EQ(rest.back().queued, 3u);

    EXPECT_TRUE(s.exhausted());
    EXPECT_EQ(s.get_explored(), 296u);
    EXPECT_EQ(s.get_peak(), 34u);
    EXPECT_EQ(s.get_queued(), 0u);
    EXPECT_FALSE(s.next());
}

TEST(Solver, breadthFirstTrace) {
    Solver s{ Board{ 2, 2 }, unique_library().pool(), Order::BreadthFirst };
    auto sols = collect(s);
    ASSERT_EQ(sols.size(), 8u);
    EXPECT_EQ(sols.front().board, make_board({ { "CGAB", "HBEH" }, { "BCFG", "FFCD" } }));
    EXPECT_EQ(sols.front().explored, 289u);
    EXPECT_EQ(sols.front().queued, 157u);
    EXPECT_EQ(sols.back().board, make_board({ { "FFDC", "BHHE" }, { "CBGF", "GCBA" } }));
    EXPECT_EQ(sols.back().explored, 296u);
    EXPECT_EQ(sols.back().queued, 0u);
    EXPECT_EQ(s.get_explored(), 296u);
    EXPECT_EQ(s.get_peak(), 172u);
}

TEST(Solver, onlyTheSymmetricImagesOfOneTiling) {
    for (auto order : { Order::DepthFirst, Order::BreadthFirst }) {
        Solver s{ Board{ 2, 2 }, unique_library().pool(), order };
        auto sols = collect(s);
        ASSERT_EQ(sols.size(), 8u);

        std::multiset<std::string> images;
        auto b = make_board({ { "FFDC", "BHHE" }, { "CBGF", "GCBA" } });
        for (auto i = 0; i < 4; i++) {
            images.insert(fmt::format("{}", b));
            images.insert(fmt::format("{}", mirror(b)));
            b = rotate_cw(b);
        }
        EXPECT_EQ(boards_of(sols), images) << fmt::format("{}", order);
        for (auto &sol : sols)
            EXPECT_TRUE(valid_tiling(sol.board));
    }
}

TEST(Solver, sameSolutionsInBothOrders) {
    // AACC and BBDD leave every outer edge free: many tilings, each reported
    // once per matching orientation of every pool entry
    Library lib{ "AACC", "BACD", "ABDC", "BBDD" };
    Solver dfs{ Board{ 2, 2 }, lib.pool(), Order::DepthFirst };
    Solver bfs{ Board{ 2, 2 }, lib.pool(), Order::BreadthFirst };
    auto a = collect(dfs);
    auto b = collect(bfs);
    EXPECT_EQ(a.size(), 640u);
    EXPECT_EQ(boards_of(a), boards_of(b));
    EXPECT_EQ(dfs.get_explored(), 1920u);
    EXPECT_EQ(bfs.get_explored(), 1920u);
    EXPECT_LT(dfs.get_peak(), bfs.get_peak());
}

TEST(Solver, countersAreMonotonic) {
    for (auto order : { Order::DepthFirst, Order::BreadthFirst }) {
        Solver s{ Board{ 2, 2 }, Library{ "AACC", "BACD", "ABDC", "BBDD" }.pool(), order };
        auto last = 0ull;
        for (auto &sol : s) {
            EXPECT_GT(sol.explored, last);
            EXPECT_LE(sol.queued, sol.explored);
            EXPECT_LE(sol.queued, s.get_peak());
            last = sol.explored;
        }
        EXPECT_LE(last, s.get_explored());
    }
}

TEST(Solver, progressSnapshots) {
    RecordingSolver s{ Board{ 2, 2 }, unique_library().pool(), Order::DepthFirst, 50 };
    auto sols = collect(s);
    EXPECT_EQ(sols.size(), 8u);
    ASSERT_EQ(s.records.size(), 5u);
    for (auto i = 0zu; i < s.records.size(); i++) {
        EXPECT_EQ(s.records[i].explored, 50u * (i + 1));
        EXPECT_EQ(s.records[i].peak, 34u);
        EXPECT_EQ(s.records[i].left, 1u);
    }
    EXPECT_EQ(s.records[0].queued, 27u);
    EXPECT_EQ(s.records[4].queued, 12u);
    EXPECT_EQ(s.records[0].best, fmt::format("{}",
                make_board({ { "FFDC", "HHBE" }, { "CBGF", "_" } })));
}

TEST(Solver, progressSnapshotsBreadthFirst) {
    RecordingSolver s{ Board{ 2, 2 }, unique_library().pool(), Order::BreadthFirst, 50 };
    collect(s);
    ASSERT_EQ(s.records.size(), 5u);
    std::vector<size_t> queued, left;
    for (auto &r : s.records)
        queued.push_back(r.queued), left.push_back(r.left);
    EXPECT_EQ(queued, (std::vector<size_t>{ 42, 77, 100, 123, 155 }));
    EXPECT_EQ(left, (std::vector<size_t>{ 2, 2, 1, 1, 1 }));
    EXPECT_EQ(s.records[0].best, fmt::format("{}",
                make_board({ { "BAGC", "GFCB" }, { "_", "_" } })));
}

TEST(Solver, progressDisabled) {
    RecordingSolver s{ Board{ 2, 2 }, unique_library().pool(), Order::DepthFirst, 0 };
    collect(s);
    EXPECT_TRUE(s.records.empty());
}

TEST(Solver, bestPartialKeepsTheLatestOnTies) {
    Solver s{ Board{ 2, 2 }, unique_library().pool(), Order::DepthFirst };
    EXPECT_EQ(s.get_best().pool.size(), 4u);
    EXPECT_EQ(s.get_best().board.count(), 0u);
    collect(s);
    EXPECT_EQ(s.get_best().board, make_board({ { "BCGA", "FFCD" }, { "HEBH", "_" } }));
    ASSERT_EQ(s.get_best().pool.size(), 1u);
    EXPECT_EQ(s.get_best().pool[0], Piece{ "BCFG" });
}

TEST(Solver, resetReplaysTheSameTrace) {
    Solver s{ Board{ 2, 2 }, unique_library().pool(), Order::BreadthFirst };
    auto a = collect(s);
    s.reset();
    EXPECT_FALSE(s.exhausted());
    EXPECT_EQ(s.get_explored(), 0u);
    EXPECT_EQ(s.get_queued(), 1u);
    auto b = collect(s);
    ASSERT_EQ(a.size(), b.size());
    for (auto i = 0zu; i < a.size(); i++) {
        EXPECT_EQ(a[i].board, b[i].board);
        EXPECT_EQ(a[i].explored, b[i].explored);
        EXPECT_EQ(a[i].queued, b[i].queued);
    }
}

TEST(Solver, stoppingEarlyIsSafe) {
    Solver s{ Board{ 2, 2 }, unique_library().pool(), Order::DepthFirst };
    auto n = 0;
    for (auto &sol : s) {
        EXPECT_TRUE(valid_tiling(sol.board));
        if (++n == 3)
            break;
    }
    EXPECT_FALSE(s.exhausted());
    EXPECT_GT(s.get_queued(), 0u);
    // the iterator picks up where the loop stopped
    auto rest = 0;
    for (auto &sol : s) {
        EXPECT_TRUE(valid_tiling(sol.board));
        rest++;
    }
    EXPECT_EQ(rest, 5);
    EXPECT_TRUE(s.exhausted());
}

TEST(Solver, tooFewPieces) {
    auto pool = unique_library().pool();
    pool.pop_back();
    Solver s{ Board{ 2, 2 }, pool, Order::DepthFirst };
    EXPECT_FALSE(s.next());
    EXPECT_TRUE(s.exhausted());
    EXPECT_GT(s.get_explored(), 0u);
}

TEST(Solver, tooManyPieces) {
    auto lib = unique_library();
    lib.push("AAAA");
    Solver s{ Board{ 2, 2 }, lib.pool(), Order::BreadthFirst };
    EXPECT_FALSE(s.next());
    EXPECT_TRUE(s.exhausted());
}

TEST(Solver, emptyPool) {
    Solver s{ Board{ 2, 2 }, Pool{}, Order::DepthFirst };
    EXPECT_FALSE(s.next());
    EXPECT_TRUE(s.exhausted());
    EXPECT_EQ(s.get_explored(), 0u);
}

TEST(Solver, everyOrientationIsReported) {
    // duplicates among the orientations are kept
    for (auto sv : { "ABCD", "AAAA" }) {
        Solver s{ Board{ 1, 1 }, Library{ sv }.pool() };
        auto sols = collect(s);
        ASSERT_EQ(sols.size(), 8u) << sv;
        auto trs = Piece{ sv }.canonical_form().orientations();
        for (auto i = 0zu; i < 8; i++) {
            EXPECT_EQ(sols[i].board.at(0, 0), trs[i]) << sv;
            EXPECT_EQ(sols[i].explored, i + 1);
            EXPECT_EQ(sols[i].queued, 0u);
        }
    }
}

TEST(Solver, expandingAFullBoardIsADefect) {
    auto full = Board{ 1, 1 }.place(Piece{ "AAAA" }, { 0, 0 });
    Solver s{ full, Library{ "BBBB" }.pool() };
    EXPECT_THROW(s.next(), std::logic_error);
}

TEST(Solver, knownPuzzleFirstSolution) {
    Solver s{ Board{ known_rows, known_cols }, known_library().pool(), Order::DepthFirst };
    auto sol = s.next();
    ASSERT_TRUE(sol);
    EXPECT_EQ(sol->explored, 504u);
    EXPECT_EQ(sol->queued, 178u);
    EXPECT_TRUE(valid_tiling(sol->board));
    EXPECT_EQ(sol->board, make_board({
            { "FDGE", "GHFC", "BHCG", "FBGG" },
            { "HFAG", "EHDE", "DBCG", "HDCA" },
            { "BDCA", "CDFC", "DBEC", "DFEA" },
            { "DBGG", "EBGA", "FFCA", "FDCE" } }));
}
