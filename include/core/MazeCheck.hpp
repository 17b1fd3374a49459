#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

// Structural checks over a maze's cell flags.
namespace MazeCheck
{
    // Cleared right/bottom walls, each internal edge counted once.
    std::size_t countOpenWalls(const Maze& maze);

    std::size_t countVisited(const Maze& maze);

    // Right walls of the last column and bottom walls of the last row all closed.
    bool boundaryIntact(const Maze& maze);

    // Cells reachable from (0,0) through cleared walls.
    std::size_t reachableFromOrigin(const Maze& maze);

    // Finished spanning tree: connected, acyclic, sealed boundary.
    bool isPerfect(const Maze& maze);
}
