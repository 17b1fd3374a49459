#include "core/Grid.hpp"

#include <limits>
#include <string>

std::optional<Position> tryMove(const Position& p, Direction dir,
                                std::size_t width, std::size_t height)
{
    switch (dir)
    {
    case Direction::Left:
        if (p.x == 0) return std::nullopt;
        return Position{p.x - 1, p.y};
    case Direction::Right:
        if (p.x + 1 >= width) return std::nullopt;
        return Position{p.x + 1, p.y};
    case Direction::Top:
        if (p.y == 0) return std::nullopt;
        return Position{p.x, p.y - 1};
    case Direction::Bottom:
        if (p.y + 1 >= height) return std::nullopt;
        return Position{p.x, p.y + 1};
    }
    return std::nullopt;
}

Grid::Grid(std::size_t width, std::size_t height)
    : width_(width), height_(height)
{
    if (width != 0 && height > std::numeric_limits<std::size_t>::max() / width) {
        throw std::length_error("Grid: width * height overflows");
    }
    cells_.assign(width * height, Cell{});
}

void Grid::checkBounds_(std::size_t x, std::size_t y) const
{
    if (!inBounds(x, y)) {
        throw std::out_of_range(
            "Grid: cell (" + std::to_string(x) + ", " + std::to_string(y) +
            ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
}

Cell Grid::cellAt(std::size_t x, std::size_t y) const
{
    checkBounds_(x, y);
    return cells_[offset(x, y)];
}

Cell& Grid::cellRef(std::size_t x, std::size_t y)
{
    checkBounds_(x, y);
    return cells_[offset(x, y)];
}
