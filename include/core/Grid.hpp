#pragma once
#include "core/Common.hpp"
#include "core/Cell.hpp"

struct Position
{
    std::size_t x{0};
    std::size_t y{0};

    bool operator==(const Position& other) const
    {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

enum class Direction : std::uint8_t
{
    Left,
    Right,
    Top,
    Bottom
};

inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Left, Direction::Right, Direction::Top, Direction::Bottom
};

// Neighbour of `p` in `dir`, or nullopt when it falls outside a width x height grid.
std::optional<Position> tryMove(const Position& p, Direction dir,
                                std::size_t width, std::size_t height);

// Fixed-size row-major cell store, offset = x + y * width.
class Grid
{
public:
    Grid() = default;
    Grid(std::size_t width, std::size_t height);

    std::size_t width() const noexcept { return width_; }
    std::size_t height() const noexcept { return height_; }
    std::size_t size() const noexcept { return cells_.size(); }
    bool empty() const noexcept { return cells_.empty(); }

    bool inBounds(std::size_t x, std::size_t y) const noexcept
    {
        return x < width_ && y < height_;
    }

    std::size_t offset(std::size_t x, std::size_t y) const noexcept
    {
        return x + y * width_;
    }

    Cell cellAt(std::size_t x, std::size_t y) const;
    Cell& cellRef(std::size_t x, std::size_t y);

    const Cell* data() const noexcept { return cells_.data(); }
    const std::vector<Cell>& cells() const noexcept { return cells_; }

private:
    void checkBounds_(std::size_t x, std::size_t y) const;

    std::size_t width_{0};
    std::size_t height_{0};
    std::vector<Cell> cells_{};
};
