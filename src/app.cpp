#include "app.hpp"
#include "core/Maze.hpp"
#include "core/MazeBuilder.hpp"
#include "core/MazeCheck.hpp"

#include <cctype>
#include <limits>
#include <sstream>

static bool parseUnsigned_(const std::string& s, std::uint64_t& out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    if (std::isspace((unsigned char)s[0])) return false;
    try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(s, &used, 10);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseArgs(const std::vector<std::string>& args, AppOptions& out, std::string& outError)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];

        if (a == "--interactive" || a == "-i") {
            out.interactive = true;
            continue;
        }

        const bool takesValue = a == "--width" || a == "--height" || a == "--seed"
                             || a == "--limit" || a == "--update-every" || a == "--delay-ms";
        if (!takesValue) {
            outError = "unknown option: " + a;
            return false;
        }
        if (i + 1 >= args.size()) {
            outError = "missing value for " + a;
            return false;
        }

        std::uint64_t v = 0;
        if (!parseUnsigned_(args[++i], v)) {
            outError = "invalid value for " + a + ": " + args[i];
            return false;
        }

        if (a == "--width")             out.width = (std::size_t)v;
        else if (a == "--height")       out.height = (std::size_t)v;
        else if (a == "--seed")         out.seed = v;
        else if (a == "--limit")        out.limit = (std::size_t)v;
        else {
            if (v > std::numeric_limits<std::uint32_t>::max()) {
                outError = a + " out of range";
                return false;
            }
            if (a == "--update-every") out.updateEvery = (std::uint32_t)v;
            else                       out.delayMs = (std::uint32_t)v;
        }
    }

    if (out.width == 0 || out.height == 0) {
        outError = "width and height must be > 0";
        return false;
    }
    return true;
}

void printUsage(std::ostream& os)
{
    os << "usage: mazegen [--width N] [--height N] [--seed S] [--limit N]\n"
          "               [--update-every N] [--delay-ms N] [--interactive]\n";
}

static void printProgress_(std::ostream& out, const Maze& maze)
{
    out << "step=" << maze.stepCount()
        << " cursor=(" << maze.cursor().x << "," << maze.cursor().y << ")"
        << " depth=" << maze.tail().size() << "\n";
}

static void printSummary_(std::ostream& out, const Maze& maze, const std::optional<std::uint64_t>& seed)
{
    out << "maze " << maze.width() << "x" << maze.height()
        << "  seed=" << (seed ? std::to_string(*seed) : std::string("random")) << "\n";
    out << "  steps:      " << maze.stepCount() << "\n";
    out << "  complete:   " << (maze.isComplete() ? "yes" : "no") << "\n";
    out << "  open walls: " << MazeCheck::countOpenWalls(maze) << "\n";
    out << "  visited:    " << MazeCheck::countVisited(maze) << "/" << maze.cells().size() << "\n";
    out << "  perfect:    " << (MazeCheck::isPerfect(maze) ? "yes" : "no") << std::endl;
}

static int runBatch_(const AppOptions& options, std::ostream& out)
{
    MazeBuilder::Options bo;
    bo.width = options.width;
    bo.height = options.height;
    bo.seed = options.seed;
    bo.limit = options.limit;
    bo.updateEvery = options.updateEvery;
    bo.delay = std::chrono::milliseconds(options.delayMs);

    Maze maze = MazeBuilder::Build(bo, [&](const Maze& m) {
        if (options.updateEvery > 0) printProgress_(out, m);
    });

    printSummary_(out, maze, options.seed);
    return 0;
}

static void printHelp_(std::ostream& out)
{
    out << "commands:\n"
           "  b W H [SEED]  build a new maze\n"
           "  s             one generation step\n"
           "  g [LIMIT]     generate (up to LIMIT steps)\n"
           "  i             show maze info\n"
           "  q             quit\n";
}

static int runInteractive_(const AppOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
{
    std::optional<Maze> maze;
    std::optional<std::uint64_t> seed = options.seed;
    maze = seed ? Maze::fromSeed(options.width, options.height, *seed)
                : Maze(options.width, options.height);

    printHelp_(out);

    std::string line;
    while (true)
    {
        out << "> " << std::flush;
        if (!std::getline(in, line)) break;

        std::istringstream ls(line);
        std::string cmd;
        if (!(ls >> cmd)) continue;

        std::vector<std::string> rest;
        for (std::string tok; ls >> tok;) rest.push_back(tok);

        try
        {
            if (cmd == "q") {
                break;
            } else if (cmd == "b") {
                std::uint64_t w = 0, h = 0, s = 0;
                if (rest.size() < 2 || rest.size() > 3
                    || !parseUnsigned_(rest[0], w) || !parseUnsigned_(rest[1], h)
                    || (rest.size() == 3 && !parseUnsigned_(rest[2], s))) {
                    err << "usage: b W H [SEED]" << std::endl;
                    continue;
                }
                if (w == 0 || h == 0) {
                    err << "width and height must be > 0" << std::endl;
                    continue;
                }
                seed = rest.size() == 3 ? std::optional<std::uint64_t>(s) : std::nullopt;
                maze = seed ? Maze::fromSeed((std::size_t)w, (std::size_t)h, *seed)
                            : Maze((std::size_t)w, (std::size_t)h);
                out << "built " << w << "x" << h << "\n";
            } else if (cmd == "s") {
                const bool done = maze->step();
                printProgress_(out, *maze);
                if (done) out << "complete\n";
            } else if (cmd == "g") {
                std::optional<std::size_t> limit;
                if (!rest.empty()) {
                    std::uint64_t l = 0;
                    if (!parseUnsigned_(rest[0], l)) {
                        err << "usage: g [LIMIT]" << std::endl;
                        continue;
                    }
                    limit = (std::size_t)l;
                }
                const bool done = maze->generate(limit);
                out << (done ? "complete" : "paused") << " after " << maze->stepCount() << " steps\n";
            } else if (cmd == "i") {
                printSummary_(out, *maze, seed);
            } else if (cmd == "h" || cmd == "?") {
                printHelp_(out);
            } else {
                err << "unknown command: " << cmd << std::endl;
            }
        }
        catch (const std::exception& e)
        {
            err << "error: " << e.what() << std::endl;
        }
    }
    return 0;
}

int runApp(const AppOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
{
    try
    {
        if (options.interactive)
            return runInteractive_(options, in, out, err);
        return runBatch_(options, out);
    }
    catch (const std::exception& e)
    {
        err << "error: " << e.what() << std::endl;
        return 1;
    }
}
