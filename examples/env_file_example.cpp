#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "strata/strata.hpp"

// Reads settings from the environment and from a .env file, e.g.
//
//   APP_DATABASE_URL="postgres://localhost/app"
//   APP_WORKERS=4
//
// Keys in the file may be either flag names or APP_ environment names.
int main(int argc, char** argv) {
    std::string databaseUrl;
    int workers = 0;
    bool verbose = false;
    std::string envFile;

    strata::FlagSet fs("app");
    fs.stringVar(databaseUrl, '\0', "database-url", "", "database connection `URL`")
        .intVar(workers, 'w', "workers", 1, "worker count")
        .boolVar(verbose, 'v', "verbose", false, "log verbose output")
        .stringVar(envFile, '\0', "env-file", ".env", "dotenv file to read");

    strata::ParseOptions opts;
    opts.envVars = true;
    opts.envVarPrefix = "APP";
    opts.environment = strata::Environment::current();
    opts.configFileFlag = "env-file";
    opts.configParser = strata::EnvFileParser{};
    opts.configAllowMissingFile = true;

    if (auto err = strata::parse(fs, std::vector<std::string>(argv + 1, argv + argc), opts)) {
        if (err->is(strata::ErrorKind::HelpRequested)) {
            std::cout << strata::help(fs);
            return 0;
        }
        spdlog::error("{}", err->message());
        return 1;
    }

    if (verbose) spdlog::set_level(spdlog::level::debug);
    spdlog::info("database-url={} workers={}", databaseUrl, workers);
    return 0;
}
