#include "core/Maze.hpp"

#include <limits>

static std::mt19937_64 entropyRng_()
{
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

Maze::Maze(std::size_t width, std::size_t height, std::mt19937_64 rng)
    : grid_(width, height), rng_(std::move(rng))
{
    tail_.push_back(cursor_);
    if (!grid_.empty())
        grid_.cellRef(0, 0).setVisited(true);
}

Maze::Maze(std::size_t width, std::size_t height)
    : Maze(width, height, entropyRng_())
{
}

Maze::Maze(std::size_t width, std::size_t height, std::uint64_t seed)
    : Maze(width, height, std::mt19937_64(seed))
{
}

Maze Maze::fromSeed(std::size_t width, std::size_t height, std::uint64_t seed)
{
    return Maze(width, height, seed);
}

std::optional<Direction> Maze::pickDirection_()
{
    std::array<Direction, 4> dirs = kAllDirections;
    std::shuffle(dirs.begin(), dirs.end(), rng_);

    for (Direction dir : dirs)
    {
        const auto next = tryMove(cursor_, dir, grid_.width(), grid_.height());
        if (!next) continue;
        if (grid_.cellAt(next->x, next->y).visited()) continue;
        return dir;
    }
    return std::nullopt;
}

void Maze::carve_(Direction dir)
{
    // the crossed edge is owned by the cell on the left / above
    switch (dir)
    {
    case Direction::Right:
        grid_.cellRef(cursor_.x, cursor_.y).setRightWall(false);
        ++cursor_.x;
        break;
    case Direction::Bottom:
        grid_.cellRef(cursor_.x, cursor_.y).setBottomWall(false);
        ++cursor_.y;
        break;
    case Direction::Left:
        --cursor_.x;
        grid_.cellRef(cursor_.x, cursor_.y).setRightWall(false);
        break;
    case Direction::Top:
        --cursor_.y;
        grid_.cellRef(cursor_.x, cursor_.y).setBottomWall(false);
        break;
    }

    grid_.cellRef(cursor_.x, cursor_.y).setVisited(true);
    tail_.push_back(cursor_);
}

bool Maze::step()
{
    if (grid_.empty()) {
        throw std::logic_error("Maze::step on a maze with a zero dimension");
    }

    if (tail_.empty())
        return true;

    ++steps_;

    if (const auto dir = pickDirection_())
    {
        carve_(*dir);
        return false;
    }

    // dead end: backtrack
    cursor_ = tail_.back();
    tail_.pop_back();
    return false;
}

bool Maze::generate(std::optional<std::size_t> limit)
{
    const std::size_t budget = limit.value_or(std::numeric_limits<std::size_t>::max());
    for (std::size_t i = 0; i < budget; ++i)
    {
        if (step())
            return true;
    }
    return false;
}
