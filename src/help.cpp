#include "strata/help.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace strata {

namespace {

constexpr const char* kIndent = "  ";

struct FlagGroup {
    std::string title;
    std::vector<const Flag*> flags;
};

std::vector<FlagGroup> groupFlags(const FlagSet& fs) {
    std::vector<FlagGroup> groups;
    for (const FlagSet* cursor = &fs; cursor != nullptr; cursor = cursor->parent()) {
        if (cursor->flags().empty()) continue;
        FlagGroup g;
        g.title = cursor == &fs ? "FLAGS" : "FLAGS (" + cursor->name() + ")";
        for (const auto& f : cursor->flags()) g.flags.push_back(f.get());
        groups.push_back(std::move(g));
    }
    return groups;
}

std::string flagLine(const Flag& f, std::size_t width) {
    std::string line = flagSpec(f);
    line.append(width - line.size() + 2, ' ');
    line += f.usage();
    const auto& def = f.defaultValue();
    const bool boring = def.empty() || (f.isBoolFlag() && def == "false");
    if (!boring) line += " (default: " + def + ")";
    while (!line.empty() && line.back() == ' ') line.pop_back();
    return line;
}

void writeFlagSections(std::ostringstream& oss, const FlagSet& fs, bool leadingBlank) {
    const auto groups = groupFlags(fs);
    std::size_t width = 0;
    for (const auto& g : groups) {
        for (const auto* f : g.flags) width = std::max(width, flagSpec(*f).size());
    }
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (leadingBlank || i > 0) oss << "\n";
        oss << groups[i].title << "\n";
        for (const auto* f : groups[i].flags) oss << kIndent << flagLine(*f, width) << "\n";
    }
}

} // namespace

std::string flagSpec(const Flag& f) {
    std::string out;
    if (f.hasShortName()) {
        out += '-';
        out += f.shortName();
        if (f.hasLongName()) out += ", --" + f.longName();
    } else {
        out += "    --" + f.longName();
    }
    if (!f.placeholder().empty()) out += " " + f.placeholder();
    return out;
}

std::string help(const FlagSet& fs) {
    std::ostringstream oss;
    oss << fs.name() << "\n";
    writeFlagSections(oss, fs, true);
    return oss.str();
}

std::string help(const Command& root) {
    const Command* cmd = root.selected() ? root.selected() : &root;

    std::ostringstream oss;
    oss << cmd->name();
    if (!cmd->shortHelp().empty()) oss << " -- " << cmd->shortHelp();
    oss << "\n";

    if (!cmd->usage().empty()) oss << "\nUSAGE\n" << kIndent << cmd->usage() << "\n";
    if (!cmd->longHelp().empty()) oss << "\n" << cmd->longHelp() << "\n";

    if (!cmd->subcommands().empty()) {
        std::size_t width = 0;
        for (const auto& sub : cmd->subcommands()) width = std::max(width, sub->name().size());
        oss << "\nSUBCOMMANDS\n";
        for (const auto& sub : cmd->subcommands()) {
            std::string line = sub->name();
            if (!sub->shortHelp().empty()) {
                line.append(width - line.size() + 2, ' ');
                line += sub->shortHelp();
            }
            oss << kIndent << line << "\n";
        }
    }

    writeFlagSections(oss, cmd->flags(), true);
    return oss.str();
}

} // namespace strata
