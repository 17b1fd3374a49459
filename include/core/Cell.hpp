#pragma once
#include "core/Common.hpp"

// One maze cell packed into a byte.
// bit 0: visited, bit 1: right wall present, bit 2: bottom wall present.
// A cell only owns the edge to its right and the edge below it; there is no
// left/top wall, those belong to the neighbour on the left/above.
class Cell
{
public:
    static constexpr std::uint8_t VISITED     = 1u << 0;
    static constexpr std::uint8_t RIGHT_WALL  = 1u << 1;
    static constexpr std::uint8_t BOTTOM_WALL = 1u << 2;
    static constexpr std::uint8_t MASK        = VISITED | RIGHT_WALL | BOTTOM_WALL;

    constexpr Cell() = default;

    static constexpr Cell fromBits(std::uint8_t bits)
    {
        Cell c;
        c.bits_ = static_cast<std::uint8_t>(bits & MASK);
        return c;
    }

    constexpr bool visited() const { return (bits_ & VISITED) != 0; }
    constexpr bool rightWall() const { return (bits_ & RIGHT_WALL) != 0; }
    constexpr bool bottomWall() const { return (bits_ & BOTTOM_WALL) != 0; }

    void setVisited(bool v) { set_(VISITED, v); }
    void setRightWall(bool v) { set_(RIGHT_WALL, v); }
    void setBottomWall(bool v) { set_(BOTTOM_WALL, v); }

    constexpr std::uint8_t bits() const { return bits_; }

    bool operator==(const Cell& other) const { return bits_ == other.bits_; }
    bool operator!=(const Cell& other) const { return bits_ != other.bits_; }

private:
    void set_(std::uint8_t flag, bool v)
    {
        if (v) bits_ = static_cast<std::uint8_t>(bits_ | flag);
        else   bits_ = static_cast<std::uint8_t>(bits_ & ~flag);
    }

    // default: not visited, both owned walls closed
    std::uint8_t bits_{RIGHT_WALL | BOTTOM_WALL};
};

static_assert(sizeof(Cell) == 1, "Cell must stay one byte for bulk export");
