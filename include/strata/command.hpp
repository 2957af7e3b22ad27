#ifndef STRATA_COMMAND_HPP
#define STRATA_COMMAND_HPP

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"
#include "flag_set.hpp"
#include "options.hpp"

namespace strata {

// A node in a command tree. Each command owns its flags and its subcommands.
//
// parse() resolves this command's flags (ancestor flags stay visible to the
// environment and config file), runs the postparse hook, then hands the
// remaining args to the subcommand named by the first one, if any. run()
// executes whichever command the parse selected.
class Command {
public:
    using ExecFunc = std::function<std::optional<Error>(Command&, const std::vector<std::string>& args)>;
    using PostparseFunc = std::function<std::optional<Error>(Command&)>;

    explicit Command(std::string name, std::string shortHelp = {}, std::string longHelp = {});

    Command(Command&& other) noexcept;
    Command& operator=(Command&& other) noexcept;
    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    // One-line synopsis, e.g. "objectctl create [FLAGS] <KEY> <VALUE>".
    Command& usage(std::string u) {
        usage_ = std::move(u);
        return *this;
    }

    Command& shortHelp(std::string s) {
        short_ = std::move(s);
        return *this;
    }

    Command& longHelp(std::string l) {
        long_ = std::move(l);
        return *this;
    }

    Command& exec(ExecFunc fn) {
        exec_ = std::move(fn);
        return *this;
    }

    // Runs after this command's flags are resolved, before dispatch to a subcommand.
    Command& postparse(PostparseFunc fn) {
        postparse_ = std::move(fn);
        return *this;
    }

    Command& addCommand(Command cmd);

    // Context is inherited from parents.
    Command& setContext(std::any ctx) {
        context_ = std::move(ctx);
        return *this;
    }

    template <typename T>
    const T* contextAs() const {
        for (auto* c = this; c; c = c->parent_) {
            if (c->context_.has_value()) return std::any_cast<T>(&c->context_);
        }
        return nullptr;
    }

    template <typename T>
    T* contextAs() {
        for (auto* c = this; c; c = c->parent_) {
            if (c->context_.has_value()) return std::any_cast<T>(&c->context_);
        }
        return nullptr;
    }

    std::optional<Error> parse(const std::vector<std::string>& args, const ParseOptions& opts = {});
    std::optional<Error> run();
    std::optional<Error> parseAndRun(const std::vector<std::string>& args, const ParseOptions& opts = {});

    // Restores every flag in the tree to its default and forgets the last parse.
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& usage() const { return usage_; }
    [[nodiscard]] const std::string& shortHelp() const { return short_; }
    [[nodiscard]] const std::string& longHelp() const { return long_; }
    [[nodiscard]] bool runnable() const { return static_cast<bool>(exec_); }

    [[nodiscard]] FlagSet& flags() { return flags_; }
    [[nodiscard]] const FlagSet& flags() const { return flags_; }

    [[nodiscard]] Command* parent() const { return parent_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Command>>& subcommands() const { return subcommands_; }
    [[nodiscard]] Command* findSubcommand(std::string_view name) const;

    // The terminal command chosen by the last parse, or nullptr before parsing.
    // After a failed parse this is the command whose flags failed.
    [[nodiscard]] Command* selected() const;

    [[nodiscard]] const std::vector<std::string>& args() const { return args_; }
    [[nodiscard]] bool isParsed() const { return parsed_; }

    // "root child grandchild".
    [[nodiscard]] std::string commandPath() const;

private:
    void reparent(Command* parent);

    std::string name_;
    std::string usage_;
    std::string short_;
    std::string long_;
    FlagSet flags_;
    ExecFunc exec_;
    PostparseFunc postparse_;
    std::any context_;

    Command* parent_{nullptr};
    std::vector<std::unique_ptr<Command>> subcommands_;

    bool parsed_{false};
    Command* selected_{nullptr};
    std::vector<std::string> args_;
};

} // namespace strata

#endif // STRATA_COMMAND_HPP
