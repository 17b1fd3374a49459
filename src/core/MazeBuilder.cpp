#include "core/MazeBuilder.hpp"

#include <limits>
#include <thread>

static bool cancelled_(const std::atomic<bool>* cancel)
{
    return cancel && cancel->load(std::memory_order_relaxed);
}

Maze MazeBuilder::Build(const Options& options,
                        const std::function<void(const Maze&)>& onUpdate)
{
    if (options.width == 0 || options.height == 0) {
        throw std::invalid_argument("MazeBuilder: width and height must be > 0");
    }

    Maze maze = options.seed
        ? Maze::fromSeed(options.width, options.height, *options.seed)
        : Maze(options.width, options.height);

    const std::size_t budget = options.limit.value_or(std::numeric_limits<std::size_t>::max());

    // step count of the last reported state, so the final update never repeats it
    std::optional<std::uint64_t> lastReported;
    auto report = [&]() {
        onUpdate(maze);
        lastReported = maze.stepCount();
    };

    std::size_t taken = 0;
    while (taken < budget && !cancelled_(options.cancel))
    {
        const bool done = maze.step();
        ++taken;
        if (done) break;

        if (onUpdate && options.updateEvery > 0 && taken % options.updateEvery == 0)
            report();

        if (options.delay.count() > 0)
            std::this_thread::sleep_for(options.delay);
    }

    if (onUpdate && lastReported != maze.stepCount())
        report();
    return maze;
}
