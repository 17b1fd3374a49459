#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

class MazeBuilder
{
public:
    struct Options
    {
        std::size_t width{16};
        std::size_t height{16};
        std::optional<std::uint64_t> seed{};   // nullopt: random
        std::optional<std::size_t> limit{};    // nullopt: run to completion
        std::uint32_t updateEvery{0};          // 0: only the final update
        std::chrono::milliseconds delay{0};    // pause between steps (animation)
        std::atomic<bool>* cancel{nullptr};
    };

    // Builds a maze one step at a time, reporting progress through onUpdate.
    // Returns the maze in whatever state it reached; a cancelled or
    // budget-limited maze can be resumed with step()/generate().
    static Maze Build(
        const Options& options,
        const std::function<void(const Maze&)>& onUpdate = {}
    );
};
