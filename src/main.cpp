#include <iostream>
#include <vector>
#include <string>
#include "cli/tracer_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

namespace {

void usage_line(const std::string& cmd, const std::string& args, const std::string& what) {
    std::cout << theme::color::TEAL << "    cctrace " << cmd << theme::color::RESET
              << theme::color::AMBER << args << theme::color::RESET
              << theme::color::DIM << what << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_line("run ", "[--command NAME] [--mode M] [--dir PATH] [--debug]", "");
    std::cout << theme::color::DIM
              << "                  Run the program under the tracer (default)"
              << theme::color::RESET << "\n";
    usage_line("list ", "[--dir PATH]", "            Recent sessions");
    usage_line("view ", "<session> [--dir PATH] [--raw]", "  Show one session");
    usage_line("patterns ", "[--mode M]", "       Redaction patterns");
    usage_line("redact ", "[FILE] [--mode M]", "    Mask a file or stdin");
    usage_line("init", "", "                          Write ~/.cctrace/config.yaml");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Modes: minimal | moderate | strict\n"
              << "    cctrace --version    Show version\n"
              << "    cctrace --help       Show this help"
              << theme::color::RESET << "\n\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        TracerCLI cli;

        std::vector<std::string> args(argv + 1, argv + argc);
        std::string cmd = args.empty() ? "run" : args[0];

        // Bare flags go to the default command.
        if (cmd.rfind("--", 0) == 0 && cmd != "--help" && cmd != "--version") {
            return cli.run_capture(args);
        }

        std::vector<std::string> rest;
        if (!args.empty()) rest.assign(args.begin() + 1, args.end());

        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "cctrace"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << CCTRACE_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            return cli.run_capture(rest);
        } else if (cmd == "list") {
            return cli.run_list(rest);
        } else if (cmd == "view") {
            return cli.run_view(rest);
        } else if (cmd == "patterns") {
            return cli.run_patterns(rest);
        } else if (cmd == "redact") {
            return cli.run_redact(rest);
        } else if (cmd == "init") {
            return cli.run_init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
