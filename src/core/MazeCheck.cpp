#include "core/MazeCheck.hpp"

#include <queue>

namespace MazeCheck
{

std::size_t countOpenWalls(const Maze& maze)
{
    std::size_t open = 0;
    for (const Cell& c : maze.cells())
    {
        if (!c.rightWall()) ++open;
        if (!c.bottomWall()) ++open;
    }
    return open;
}

std::size_t countVisited(const Maze& maze)
{
    const auto& cells = maze.cells();
    return (std::size_t)std::count_if(cells.begin(), cells.end(),
                                      [](const Cell& c) { return c.visited(); });
}

bool boundaryIntact(const Maze& maze)
{
    const std::size_t W = maze.width();
    const std::size_t H = maze.height();
    if (W == 0 || H == 0) return true;

    for (std::size_t y = 0; y < H; ++y)
        if (!maze.cellAt(W - 1, y).rightWall()) return false;
    for (std::size_t x = 0; x < W; ++x)
        if (!maze.cellAt(x, H - 1).bottomWall()) return false;
    return true;
}

std::size_t reachableFromOrigin(const Maze& maze)
{
    const std::size_t W = maze.width();
    const std::size_t H = maze.height();
    if (W == 0 || H == 0) return 0;

    std::vector<uint8_t> seen(W * H, 0);
    std::queue<Position> q;
    q.push({0, 0});
    seen[0] = 1;
    std::size_t reached = 0;

    auto visit = [&](std::size_t x, std::size_t y) {
        const std::size_t k = maze.cellOffset(x, y);
        if (seen[k]) return;
        seen[k] = 1;
        q.push({x, y});
    };

    while (!q.empty())
    {
        const Position p = q.front(); q.pop();
        ++reached;

        const Cell c = maze.cellAt(p.x, p.y);
        if (p.x + 1 < W && !c.rightWall()) visit(p.x + 1, p.y);
        if (p.y + 1 < H && !c.bottomWall()) visit(p.x, p.y + 1);
        // left / top edges are owned by the neighbour
        if (p.x > 0 && !maze.cellAt(p.x - 1, p.y).rightWall()) visit(p.x - 1, p.y);
        if (p.y > 0 && !maze.cellAt(p.x, p.y - 1).bottomWall()) visit(p.x, p.y - 1);
    }
    return reached;
}

bool isPerfect(const Maze& maze)
{
    const std::size_t n = maze.cells().size();
    if (n == 0) return false;

    // n cells, n-1 edges, connected => tree
    return maze.isComplete()
        && countVisited(maze) == n
        && countOpenWalls(maze) == n - 1
        && boundaryIntact(maze)
        && reachableFromOrigin(maze) == n;
}

} // namespace MazeCheck
