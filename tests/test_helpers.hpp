#ifndef STRATA_TESTS_TEST_HELPERS_HPP
#define STRATA_TESTS_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "strata/flag_set.hpp"
#include "strata/options.hpp"

namespace strata::test {

// Writes `contents` to a fresh file under the temp directory; removed on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& contents, const std::string& suffix = ".conf") {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("strata_test_" + std::to_string(stamp) + "_" + std::to_string(counter++) + suffix);
        std::ofstream out(path_, std::ios::binary);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Captures every (name, value) a config parser reports, in order.
class RecordingSetter {
public:
    using Call = std::pair<std::string, std::string>;

    [[nodiscard]] ConfigSetter setter() {
        return [this](const std::string& name, const std::string& value) -> std::optional<Error> {
            calls_.emplace_back(name, value);
            return std::nullopt;
        };
    }

    [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }

private:
    std::vector<Call> calls_;
};

// The usual test flag set: -s/--str, -i/--int, -f/--float, -b/--bool,
// -d/--dur and the repeatable -x/--xs.
struct Vars {
    std::string s;
    int i{0};
    double f{0.0};
    bool b{false};
    Duration d{0};
    std::vector<std::string> x;

    FlagSet fs{"test"};

    Vars() {
        fs.stringVar(s, 's', "str", "", "string")
            .intVar(i, 'i', "int", 0, "int")
            .doubleVar(f, 'f', "float", 0.0, "float64")
            .boolVar(b, 'b', "bool", false, "bool")
            .durationVar(d, 'd', "dur", Duration(0), "duration")
            .stringListVar(x, 'x', "xs", "collection of strings (repeatable)");
    }

    Vars(const Vars&) = delete;
    Vars& operator=(const Vars&) = delete;
};

} // namespace strata::test

#endif // STRATA_TESTS_TEST_HELPERS_HPP
