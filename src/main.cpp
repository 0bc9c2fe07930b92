#include "application.hpp"
#include "instance_coordinator.hpp"
#include "logging.hpp"
#include "paths.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

void show_help(const char *bin_name)
{
    std::cout << "Flowstate theme store\n\n"
              << "Usage: " << bin_name << " [OPTIONS] <command> [theme-id]\n\n"
              << "Commands:\n"
              << "  list            List installed themes\n"
              << "  current         Show the active theme\n"
              << "  validate <id>   Check a theme's manifest and required files\n"
              << "  switch <id>     Make <id> the active theme and run the hook\n"
              << "  reset           Clear the active theme\n"
              << "  serve           Hold the theme store and answer activation requests\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message and exit\n"
              << "  -v, --verbose  Enable debug logging\n"
              << "  -q, --quiet    Suppress all output (redirect stdout/stderr to /dev/null)\n\n"
              << "Exit status: 0 success, 1 failure, 2 usage error, 3 another instance owns the store\n";
}

int main(int argc, char *argv[])
{
    bool verbose = false;
    bool quiet = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            show_help(argv[0]);
            return ExitStatus::OK;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            verbose = true;
        }
        else if (arg == "-q" || arg == "--quiet")
        {
            quiet = true;
        }
        else if (arg.size() > 1 && arg[0] == '-' && positional.empty())
        {
            std::cerr << "Unknown option: " << arg << "\n";
            show_help(argv[0]);
            return ExitStatus::USAGE;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        show_help(argv[0]);
        return ExitStatus::USAGE;
    }

    if (quiet)
    {
        (void) !std::freopen("/dev/null", "w", stdout);
        (void) !std::freopen("/dev/null", "w", stderr);
    }

    Paths paths = Paths::fromEnvironment();
    Logging::init(paths.dataDir().empty() ? "" : paths.logFile(), verbose);

    const std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    GioActivationChannel channel(Application::APP_ID);
    Application app(paths, channel);
    int status = app.run(command, args);

    Logging::shutdown();
    return status;
}
