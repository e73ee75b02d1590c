#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

// Command implementations behind main(). Each returns the process exit
// code; problems are reported on the console through theme helpers.
class TracerCLI {
public:
    int run_capture(const std::vector<std::string>& args);
    int run_list(const std::vector<std::string>& args);
    int run_view(const std::vector<std::string>& args);
    int run_patterns(const std::vector<std::string>& args);
    int run_redact(const std::vector<std::string>& args);
    int run_init();

private:
    // Config::load(); warnings and a parse failure are printed here.
    Result<Config> load_config();
};
