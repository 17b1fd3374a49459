#include "core/Common.hpp"
#include "app.hpp"

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    AppOptions options;
    std::string error;
    if (!parseArgs(args, options, error)) {
        std::cerr << "mazegen: " << error << std::endl;
        printUsage(std::cerr);
        return 1;
    }

    return runApp(options, std::cin, std::cout, std::cerr);
}
