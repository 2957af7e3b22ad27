#include "strata/parsers.hpp"

#include <string_view>

#include "strata/utils.hpp"

namespace strata {

namespace {

// Returns false when `value` is not a well-formed quoted string.
bool unquote(std::string_view value, std::string& out) {
    if (value.size() < 2) return false;
    const char quote = value.front();
    if (value.back() != quote) return false;
    const std::string_view body = value.substr(1, value.size() - 2);

    if (quote == '`') {
        if (body.find('`') != std::string_view::npos) return false;
        out = std::string(body);
        return true;
    }
    if (quote != '"') return false;

    std::string result;
    result.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '"') return false;
        if (c != '\\') {
            result.push_back(c);
            continue;
        }
        if (++i >= body.size()) return false;
        switch (body[i]) {
            case 'n': result.push_back('\n'); break;
            case 't': result.push_back('\t'); break;
            case 'r': result.push_back('\r'); break;
            case '\\': result.push_back('\\'); break;
            case '"': result.push_back('"'); break;
            default: return false;
        }
    }
    out = std::move(result);
    return true;
}

} // namespace

std::optional<Error> EnvFileParser::operator()(std::istream& in, const ConfigSetter& set) const {
    std::string raw;
    std::size_t lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        std::string_view line = utils::trim(raw);
        if (line.empty() || line.front() == '#') continue;

        const auto eq = line.find('=');
        std::string_view name = eq == std::string_view::npos ? std::string_view{} : utils::trim(line.substr(0, eq));
        if (name.empty()) {
            return Error(ErrorKind::ConfigParseError, "line " + std::to_string(lineNo) + ": invalid line: " + std::string(line));
        }
        if (!prefix_.empty()) {
            const std::string withSep = prefix_ + "_";
            if (utils::startsWith(name, withSep)) name.remove_prefix(withSep.size());
        }

        const std::string_view value = utils::trim(line.substr(eq + 1));
        std::string text(value);
        std::string unquoted;
        if (unquote(value, unquoted)) text = std::move(unquoted);

        if (auto err = set(std::string(name), text)) return err;
    }
    if (in.bad()) return Error(ErrorKind::ConfigParseError, "read config: stream error");
    return std::nullopt;
}

} // namespace strata
