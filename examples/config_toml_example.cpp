#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "strata/strata.hpp"
#include "strata/toml_parser.hpp"

// Reads nested keys from a TOML file; --server.port maps to server.port.
//
// tags = ["a", "b"]
// [server]
// host = "example.com"
// port = 9090
int main(int argc, char** argv) {
    std::string host;
    int port = 0;
    std::vector<std::string> tags;
    std::string config;

    strata::FlagSet fs("config_toml");
    fs.stringVar(host, '\0', "server.host", "localhost", "server host")
        .intVar(port, 'p', "server.port", 8080, "server port")
        .stringListVar(tags, 't', "tags", "tags (repeatable)")
        .stringVar(config, 'c', "config", "config.toml", "config file");

    strata::ParseOptions opts;
    opts.configFileFlag = "config";
    opts.configParser = strata::TomlParser{};
    opts.configAllowMissingFile = true;

    if (auto err = strata::parse(fs, std::vector<std::string>(argv + 1, argv + argc), opts)) {
        if (err->is(strata::ErrorKind::HelpRequested)) {
            std::cout << strata::help(fs);
            return 0;
        }
        spdlog::error("{}", err->message());
        return 1;
    }

    std::cout << "host=" << host << " port=" << port << " tags=" << tags.size() << "\n";
    return 0;
}
