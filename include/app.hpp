#pragma once
#include "core/Common.hpp"

struct AppOptions
{
    std::size_t width{16};
    std::size_t height{16};
    std::optional<std::uint64_t> seed{};
    std::optional<std::size_t> limit{};
    std::uint32_t updateEvery{0};
    std::uint32_t delayMs{0};
    bool interactive{false};
};

// Parses command-line flags (argv[0] excluded). On failure returns false and
// fills outError; `out` is left partially filled.
bool parseArgs(const std::vector<std::string>& args, AppOptions& out, std::string& outError);

void printUsage(std::ostream& os);

// Returns the process exit status.
int runApp(const AppOptions& options, std::istream& in, std::ostream& out, std::ostream& err);
