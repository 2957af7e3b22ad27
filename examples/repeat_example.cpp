#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "strata/strata.hpp"

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

// app -t a --tag b, APP_TAG="a,b\,c", or "tag a" lines in a config file.
int main(int argc, char** argv) {
    std::vector<std::string> tags;
    std::vector<std::string> regions;

    strata::FlagSet fs("app");
    fs.stringListVar(tags, 't', "tag", "tag values (repeatable)")
        .value('\0', "region", std::make_unique<strata::UniqueListValue<std::string>>(regions), "distinct regions (repeatable)");

    strata::ParseOptions opts;
    opts.envVars = true;
    opts.envVarPrefix = "APP";
    opts.envVarSplit = ",";
    opts.environment = strata::Environment::current();

    if (auto err = strata::parse(fs, std::vector<std::string>(argv + 1, argv + argc), opts)) {
        if (err->is(strata::ErrorKind::HelpRequested)) {
            std::cout << strata::help(fs);
            return 0;
        }
        std::cerr << "error: " << *err << "\n";
        return 1;
    }

    std::cout << "tags=" << join(tags, "|") << "\n";
    std::cout << "regions=" << join(regions, "|") << "\n";
    return 0;
}
