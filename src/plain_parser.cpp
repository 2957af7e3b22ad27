#include "strata/parsers.hpp"

#include <string_view>

#include "strata/utils.hpp"

namespace strata {

std::optional<Error> PlainParser::operator()(std::istream& in, const ConfigSetter& set) const {
    std::string raw;
    while (std::getline(in, raw)) {
        std::string_view line = utils::trim(raw);
        if (line.empty() || line.front() == '#') continue;

        std::string_view name = line;
        std::string_view value = "true";
        if (const auto space = line.find_first_of(" \t"); space != std::string_view::npos) {
            name = line.substr(0, space);
            value = utils::trim(line.substr(space));
            if (const auto comment = value.find(" #"); comment != std::string_view::npos) {
                value = utils::trim(value.substr(0, comment));
            }
            if (!value.empty() && value.front() == '#') value = "true";
        }
        while (!name.empty() && name.front() == '-') name.remove_prefix(1);
        if (name.empty()) continue;

        if (auto err = set(std::string(name), std::string(value))) return err;
    }
    if (in.bad()) return Error(ErrorKind::ConfigParseError, "read config: stream error");
    return std::nullopt;
}

} // namespace strata
