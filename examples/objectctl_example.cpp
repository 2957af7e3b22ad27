#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "strata/strata.hpp"

namespace {

// In-memory object store standing in for a remote API.
class ObjectClient {
public:
    std::optional<strata::Error> create(const std::string& key, const std::string& value, bool overwrite) {
        if (!overwrite && objects_.count(key) > 0) return fail("object exists: " + key);
        objects_[key] = value;
        return std::nullopt;
    }

    std::optional<strata::Error> remove(const std::string& key, bool force) {
        if (objects_.erase(key) == 0 && !force) return fail("object not found: " + key);
        return std::nullopt;
    }

    [[nodiscard]] const std::map<std::string, std::string>& list() const { return objects_; }

private:
    static strata::Error fail(std::string msg) { return strata::Error(strata::ErrorKind::Exec, std::move(msg)); }

    std::map<std::string, std::string> objects_{{"apple", "red"}, {"banana", "yellow"}};
};

struct RootConfig {
    std::string token;
    bool verbose{false};
    std::optional<ObjectClient> client;
};

std::string joinFrom(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (i > from) out += " ";
        out += args[i];
    }
    return out;
}

strata::Command makeCreate(bool& overwrite) {
    strata::Command cmd("create", "create or overwrite an object");
    cmd.usage("objectctl create [FLAGS] <KEY> <VALUE>");
    cmd.flags().boolVar(overwrite, '\0', "overwrite", false, "overwrite an existing object");
    cmd.exec([&overwrite](strata::Command& self, const std::vector<std::string>& args) -> std::optional<strata::Error> {
        if (args.size() < 2) return strata::Error(strata::ErrorKind::Exec, "create requires at least 2 args");
        auto* cfg = self.contextAs<RootConfig*>();
        if (auto err = (*cfg)->client->create(args[0], joinFrom(args, 1), overwrite)) return err;
        if ((*cfg)->verbose) spdlog::info("create {} OK", args[0]);
        return std::nullopt;
    });
    return cmd;
}

strata::Command makeDelete(bool& force) {
    strata::Command cmd("delete", "delete an object");
    cmd.usage("objectctl delete [FLAGS] <KEY>");
    cmd.flags().boolVar(force, 'f', "force", false, "force delete");
    cmd.exec([&force](strata::Command& self, const std::vector<std::string>& args) -> std::optional<strata::Error> {
        if (args.size() != 1) return strata::Error(strata::ErrorKind::Exec, "delete requires 1 arg");
        auto* cfg = self.contextAs<RootConfig*>();
        if (auto err = (*cfg)->client->remove(args[0], force)) return err;
        if ((*cfg)->verbose) spdlog::info("delete {} OK", args[0]);
        return std::nullopt;
    });
    return cmd;
}

strata::Command makeList(bool& withValues) {
    strata::Command cmd("list", "list available objects");
    cmd.usage("objectctl list [FLAGS]");
    cmd.flags().boolVar(withValues, 'a', "all", false, "include object values");
    cmd.exec([&withValues](strata::Command& self, const std::vector<std::string>&) -> std::optional<strata::Error> {
        auto* cfg = self.contextAs<RootConfig*>();
        for (const auto& [key, value] : (*cfg)->client->list()) {
            std::cout << key;
            if (withValues) std::cout << "\t" << value;
            std::cout << "\n";
        }
        return std::nullopt;
    });
    return cmd;
}

} // namespace

int main(int argc, char** argv) {
    RootConfig cfg;
    bool overwrite = false;
    bool force = false;
    bool withValues = false;

    strata::Command root("objectctl", "control objects",
                         "Manage a small key/value object store. Every flag can also be\n"
                         "set as OBJECTCTL_<NAME> in the environment.");
    root.usage("objectctl [FLAGS] <SUBCOMMAND> ...");
    root.flags()
        .stringVar(cfg.token, '\0', "token", "", "secret token for object API")
        .boolVar(cfg.verbose, 'v', "verbose", false, "log verbose output");
    root.setContext(&cfg);
    root.addCommand(makeCreate(overwrite));
    root.addCommand(makeDelete(force));
    root.addCommand(makeList(withValues));

    strata::ParseOptions opts;
    opts.envVars = true;
    opts.envVarPrefix = "OBJECTCTL";
    opts.environment = strata::Environment::current();

    if (auto err = root.parse(std::vector<std::string>(argv + 1, argv + argc), opts)) {
        std::cerr << strata::help(root) << "\n";
        if (err->is(strata::ErrorKind::HelpRequested)) return 0;
        std::cerr << "error: " << err->wrap("parse") << "\n";
        return 1;
    }

    if (cfg.verbose) spdlog::set_level(spdlog::level::debug);
    if (cfg.token != "SECRET") {
        std::cerr << "error: construct API client: invalid token\n";
        return 1;
    }
    cfg.client.emplace();

    if (auto err = root.run()) {
        if (err->is(strata::ErrorKind::NoExec)) {
            std::cerr << strata::help(root);
            return 0;
        }
        std::cerr << "error: " << err->wrap("run") << "\n";
        return 1;
    }
    return 0;
}
