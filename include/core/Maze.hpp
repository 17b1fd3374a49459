#pragma once
#include "core/Common.hpp"
#include "core/Cell.hpp"
#include "core/Grid.hpp"

// Perfect-maze generator: randomized depth-first traversal with backtracking.
//
// The traversal is driven from outside one move at a time (step) or in bulk
// (generate). All state lives in the instance between calls, so a caller can
// animate generation frame by frame, pause it, and resume it later.
class Maze
{
public:
    // Seeded from std::random_device; successive runs differ.
    Maze(std::size_t width, std::size_t height);
    // Same seed and dimensions always give the same maze.
    Maze(std::size_t width, std::size_t height, std::uint64_t seed);

    static Maze fromSeed(std::size_t width, std::size_t height, std::uint64_t seed);

    std::size_t width() const noexcept { return grid_.width(); }
    std::size_t height() const noexcept { return grid_.height(); }

    std::size_t cellOffset(std::size_t x, std::size_t y) const noexcept
    {
        return grid_.offset(x, y);
    }

    // throws std::out_of_range
    Cell cellAt(std::size_t x, std::size_t y) const { return grid_.cellAt(x, y); }

    // Row-major view over all width*height cells, valid for the maze's lifetime.
    const std::vector<Cell>& cells() const noexcept { return grid_.cells(); }
    const Cell* cellsData() const noexcept { return grid_.data(); }

    const Position& cursor() const noexcept { return cursor_; }
    const std::vector<Position>& tail() const noexcept { return tail_; }
    bool isComplete() const noexcept { return tail_.empty(); }
    // moves made so far (forward and backtrack); the final completing call is not counted
    std::uint64_t stepCount() const noexcept { return steps_; }

    // One traversal move. Returns true once the maze is fully generated;
    // further calls keep returning true without touching any state.
    bool step();

    // Calls step() until it reports completion or `limit` steps have run.
    // Returns false when the budget ran out first.
    bool generate(std::optional<std::size_t> limit = std::nullopt);

private:
    Maze(std::size_t width, std::size_t height, std::mt19937_64 rng);

    std::optional<Direction> pickDirection_();
    void carve_(Direction dir);

    Grid grid_;
    Position cursor_{0, 0};
    std::vector<Position> tail_;
    std::mt19937_64 rng_;
    std::uint64_t steps_{0};
};
