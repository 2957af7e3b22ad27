#include "strata/command.hpp"

#include <spdlog/spdlog.h>

#include "strata/parse.hpp"
#include "strata/utils.hpp"

namespace strata {

Command::Command(std::string name, std::string shortHelp, std::string longHelp)
    : name_(std::move(name)), short_(std::move(shortHelp)), long_(std::move(longHelp)), flags_(name_) {}

Command::Command(Command&& other) noexcept
    : name_(std::move(other.name_)),
      usage_(std::move(other.usage_)),
      short_(std::move(other.short_)),
      long_(std::move(other.long_)),
      flags_(std::move(other.flags_)),
      exec_(std::move(other.exec_)),
      postparse_(std::move(other.postparse_)),
      context_(std::move(other.context_)),
      parent_(other.parent_),
      subcommands_(std::move(other.subcommands_)),
      parsed_(other.parsed_),
      selected_(other.selected_ == &other ? this : other.selected_),
      args_(std::move(other.args_)) {
    for (auto& c : subcommands_) c->reparent(this);
}

Command& Command::operator=(Command&& other) noexcept {
    if (this == &other) return *this;
    name_ = std::move(other.name_);
    usage_ = std::move(other.usage_);
    short_ = std::move(other.short_);
    long_ = std::move(other.long_);
    flags_ = std::move(other.flags_);
    exec_ = std::move(other.exec_);
    postparse_ = std::move(other.postparse_);
    context_ = std::move(other.context_);
    parent_ = other.parent_;
    subcommands_ = std::move(other.subcommands_);
    parsed_ = other.parsed_;
    selected_ = other.selected_ == &other ? this : other.selected_;
    args_ = std::move(other.args_);
    for (auto& c : subcommands_) c->reparent(this);
    return *this;
}

Command& Command::addCommand(Command cmd) {
    auto child = std::make_unique<Command>(std::move(cmd));
    child->reparent(this);
    subcommands_.push_back(std::move(child));
    return *this;
}

void Command::reparent(Command* parent) {
    parent_ = parent;
    flags_.setParent(parent ? &parent->flags_ : nullptr);
    for (auto& c : subcommands_) c->reparent(this);
}

Command* Command::findSubcommand(std::string_view name) const {
    for (const auto& c : subcommands_) {
        if (utils::equalFold(c->name_, name)) return c.get();
    }
    return nullptr;
}

std::optional<Error> Command::parse(const std::vector<std::string>& args, const ParseOptions& opts) {
    if (name_.empty()) return Error(ErrorKind::InvalidCommand, "command name is required");
    if (parsed_) return Error(ErrorKind::AlreadyParsed, name_ + ": already parsed");

    // Children may have been moved since they were added.
    reparent(parent_);

    std::optional<Error> err = strata::parse(flags_, args, opts);
    if (!err && postparse_) err = postparse_(*this);
    if (err) {
        selected_ = this;
        return err->wrap(name_);
    }

    parsed_ = true;
    args_ = flags_.args();

    if (!args_.empty()) {
        if (Command* sub = findSubcommand(args_.front())) {
            spdlog::debug("{}: selected subcommand {}", name_, sub->name_);
            selected_ = sub;
            return sub->parse(std::vector<std::string>(args_.begin() + 1, args_.end()), opts);
        }
    }

    selected_ = this;
    return std::nullopt;
}

std::optional<Error> Command::run() {
    if (!parsed_ || selected_ == nullptr) return Error(ErrorKind::NotParsed, name_ + ": not parsed");
    if (selected_ != this) return selected_->run();
    if (!exec_) return Error::noExec().wrap(name_);
    return exec_(*this, args_);
}

std::optional<Error> Command::parseAndRun(const std::vector<std::string>& args, const ParseOptions& opts) {
    if (auto err = parse(args, opts)) return err->wrap("parse");
    if (auto err = run()) return err->wrap("run");
    return std::nullopt;
}

void Command::reset() {
    flags_.reset();
    for (auto& c : subcommands_) c->reset();
    parsed_ = false;
    selected_ = nullptr;
    args_.clear();
}

Command* Command::selected() const {
    if (selected_ == nullptr) return nullptr;
    if (selected_ == this) return selected_;
    return selected_->selected();
}

std::string Command::commandPath() const {
    std::string path = name_;
    for (auto* c = parent_; c; c = c->parent_) path = c->name_ + " " + path;
    return path;
}

} // namespace strata
