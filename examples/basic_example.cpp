#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "strata/strata.hpp"

int main(int argc, char** argv) {
    std::string listen;
    strata::Duration refresh{};
    bool debug = false;
    std::string logLevel;
    std::string config;

    strata::FlagSet fs("myprogram");
    fs.stringVar(listen, 'l', "listen", "localhost:8080", "listen `ADDR`")
        .durationVar(refresh, 'r', "refresh", std::chrono::seconds(15), "refresh interval")
        .boolVar(debug, 'd', "debug", false, "log debug information")
        .enumVar(logLevel, '\0', "log-level", {"info", "debug", "warn", "error"}, "log level")
        .stringVar(config, 'c', "config", "", "config file (optional)");

    strata::ParseOptions opts;
    opts.envVars = true;
    opts.envVarPrefix = "MY_PROGRAM";
    opts.environment = strata::Environment::current();
    opts.configFileFlag = "config";
    opts.configParser = strata::PlainParser{};
    opts.configAllowMissingFile = true;

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (auto err = strata::parse(fs, args, opts)) {
        std::cerr << strata::help(fs) << "\n";
        if (err->is(strata::ErrorKind::HelpRequested)) return 0;
        std::cerr << "error: " << *err << "\n";
        return 1;
    }

    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::from_str(logLevel));
    spdlog::info("listen={} refresh={} debug={}", listen, strata::convert::formatDuration(refresh), debug);
    for (const auto& arg : fs.args()) spdlog::info("arg: {}", arg);
    return 0;
}
