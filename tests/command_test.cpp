#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "strata/command.hpp"
#include "strata/parsers.hpp"
#include "test_helpers.hpp"

using namespace strata;
using strata::test::TempFile;

namespace {

using Args = std::vector<std::string>;

// objectctl [-v] repeat [-n COUNT] ...
struct Tree {
    bool verbose{false};
    int count{0};
    Args execArgs;
    int execCalls{0};
    Command root{"objectctl", "control objects"};

    Tree() {
        root.flags().boolVar(verbose, 'v', "verbose", false, "log verbose output");

        Command repeat("repeat", "print args N times");
        repeat.flags().intVar(count, 'n', "count", 3, "repetitions");
        repeat.exec([this](Command&, const Args& args) -> std::optional<Error> {
            ++execCalls;
            execArgs = args;
            return std::nullopt;
        });
        root.addCommand(std::move(repeat));
    }

    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;
};

} // namespace

TEST(Command, DispatchesToSubcommand) {
    Tree t;
    ASSERT_FALSE(t.root.parseAndRun({"-v", "repeat", "-n", "5", "hello"}).has_value());
    EXPECT_TRUE(t.verbose);
    EXPECT_EQ(t.count, 5);
    EXPECT_EQ(t.execCalls, 1);
    EXPECT_EQ(t.execArgs, (Args{"hello"}));

    Command* selected = t.root.selected();
    ASSERT_NE(selected, nullptr);
    EXPECT_EQ(selected->name(), "repeat");
    EXPECT_EQ(selected->commandPath(), "objectctl repeat");
}

TEST(Command, SubcommandDefaultsApply) {
    Tree t;
    ASSERT_FALSE(t.root.parseAndRun({"repeat"}).has_value());
    EXPECT_FALSE(t.verbose);
    EXPECT_EQ(t.count, 3);
    EXPECT_TRUE(t.execArgs.empty());
}

TEST(Command, SubcommandNamesMatchIgnoringCase) {
    Tree t;
    ASSERT_FALSE(t.root.parse({"RePeAt", "x"}).has_value());
    EXPECT_EQ(t.root.selected()->name(), "repeat");
    EXPECT_EQ(t.root.selected()->args(), (Args{"x"}));
}

TEST(Command, ParentFlagsNotTokenizedByChild) {
    Tree t;
    const auto err = t.root.parse({"repeat", "-v"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::UnknownFlag);
    EXPECT_EQ(t.root.selected()->name(), "repeat");
}

TEST(Command, NoExec) {
    Tree t;
    ASSERT_FALSE(t.root.parse({"-v"}).has_value());
    EXPECT_EQ(t.root.selected(), &t.root);

    const auto err = t.root.run();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::NoExec);
    EXPECT_EQ(err->message(), "objectctl: no exec function");
}

TEST(Command, ParseAndRunWrapsStages) {
    Tree t;
    auto err = t.root.parseAndRun({});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message(), "run: objectctl: no exec function");

    Tree bad;
    err = bad.root.parseAndRun({"repeat", "-n", "many"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::ParseValueError);
    EXPECT_EQ(err->message().rfind("parse: repeat: parse args: ", 0), 0u);
    EXPECT_EQ(bad.execCalls, 0);
}

TEST(Command, RunBeforeParse) {
    Tree t;
    const auto err = t.root.run();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::NotParsed);
}

TEST(Command, ParseTwiceThenReset) {
    Tree t;
    ASSERT_FALSE(t.root.parse({"-v", "repeat", "-n", "9"}).has_value());

    const auto again = t.root.parse({});
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->kind(), ErrorKind::AlreadyParsed);

    t.root.reset();
    EXPECT_FALSE(t.verbose);
    EXPECT_EQ(t.count, 3);
    EXPECT_FALSE(t.root.isParsed());
    EXPECT_EQ(t.root.selected(), nullptr);

    ASSERT_FALSE(t.root.parse({"repeat"}).has_value());
    EXPECT_EQ(t.count, 3);
}

TEST(Command, EmptyNameIsInvalid) {
    Command unnamed("");
    const auto err = unnamed.parse({});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::InvalidCommand);
}

TEST(Command, ExecErrorsPropagate) {
    Command root("root");
    root.exec([](Command&, const Args&) -> std::optional<Error> { return Error(ErrorKind::Exec, "boom"); });
    const auto err = root.parseAndRun({});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::Exec);
    EXPECT_EQ(err->message(), "run: boom");
}

TEST(Command, PostparseSeesResolvedFlags) {
    Tree t;
    bool sawVerbose = false;
    t.root.postparse([&](Command& cmd) -> std::optional<Error> {
        sawVerbose = t.verbose;
        EXPECT_EQ(&cmd, &t.root);
        return std::nullopt;
    });
    ASSERT_FALSE(t.root.parseAndRun({"-v", "repeat"}).has_value());
    EXPECT_TRUE(sawVerbose);
}

TEST(Command, PostparseErrorStopsDispatch) {
    Tree t;
    t.root.postparse([](Command&) -> std::optional<Error> { return Error(ErrorKind::Exec, "not ready"); });
    const auto err = t.root.parseAndRun({"repeat"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message(), "parse: objectctl: not ready");
    EXPECT_EQ(t.execCalls, 0);
}

TEST(Command, HelpRequestedSelectsFailingCommand) {
    Tree t;
    const auto err = t.root.parse({"repeat", "--help"});
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE(err->is(ErrorKind::HelpRequested));
    EXPECT_EQ(t.root.selected()->name(), "repeat");
}

TEST(Command, ContextInheritedFromAncestors) {
    Tree t;
    std::string seen;
    t.root.setContext(std::string("shared"));
    Command peek("peek");
    peek.exec([&](Command& cmd, const Args&) -> std::optional<Error> {
        if (const auto* ctx = cmd.contextAs<std::string>()) seen = *ctx;
        return std::nullopt;
    });
    t.root.addCommand(std::move(peek));

    ASSERT_FALSE(t.root.parseAndRun({"peek"}).has_value());
    EXPECT_EQ(seen, "shared");
    EXPECT_EQ(t.root.contextAs<int>(), nullptr);
}

TEST(Command, AncestorFlagsResolvedFromConfig) {
    TempFile conf("verbose true\ncount 9\n");
    Tree t;
    ParseOptions opts;
    opts.configFile = conf.path();
    opts.configParser = PlainParser{};
    opts.configIgnoreUndefinedFlags = true;

    ASSERT_FALSE(t.root.parseAndRun({"repeat"}, opts).has_value());
    EXPECT_TRUE(t.verbose);
    EXPECT_EQ(t.count, 9);
}

TEST(Command, AncestorFlagsResolvedFromEnvironment) {
    Tree t;
    ParseOptions opts;
    opts.envVars = true;
    opts.envVarPrefix = "OBJ";
    opts.environment = Environment{{"OBJ_VERBOSE", "true"}, {"OBJ_COUNT", "4"}};

    ASSERT_FALSE(t.root.parseAndRun({"repeat", "-n", "2"}, opts).has_value());
    EXPECT_TRUE(t.verbose);
    EXPECT_EQ(t.count, 2);
}

TEST(Command, ChildFlagCollidingWithAncestor) {
    bool v1 = false;
    bool v2 = false;
    Command root("root");
    root.flags().boolVar(v1, 'v', "verbose", false, "verbose");
    Command child("child");
    child.flags().boolVar(v2, 'v', "vivid", false, "vivid");
    child.exec([](Command&, const Args&) -> std::optional<Error> { return std::nullopt; });
    root.addCommand(std::move(child));

    const auto err = root.parse({"child"});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::DuplicateFlag);
}

TEST(Command, UnmatchedPositionalStaysWithParent) {
    Tree t;
    Args got;
    t.root.exec([&](Command&, const Args& args) -> std::optional<Error> {
        got = args;
        return std::nullopt;
    });
    ASSERT_FALSE(t.root.parseAndRun({"nope", "repeat"}).has_value());
    EXPECT_EQ(got, (Args{"nope", "repeat"}));
    EXPECT_EQ(t.execCalls, 0);
}

TEST(Command, ConfigFileFlagDeclaredOnSubcommand) {
    TempFile conf("count 7\n");
    int count = 0;
    std::string config;
    bool ran = false;

    Command root("app");
    Command run("run");
    run.flags()
        .stringVar(config, 'c', "config", "", "config file")
        .intVar(count, 'n', "count", 1, "count");
    run.exec([&](Command&, const Args&) -> std::optional<Error> {
        ran = true;
        return std::nullopt;
    });
    root.addCommand(std::move(run));

    ParseOptions opts;
    opts.configFileFlag = "config";
    opts.configParser = PlainParser{};

    ASSERT_FALSE(root.parseAndRun({"run", "--config", conf.path()}, opts).has_value());
    EXPECT_EQ(count, 7);
    EXPECT_TRUE(ran);
}

TEST(Command, BoolFlagDoesNotSwallowSubcommandName) {
    bool verbose = false;
    bool ran = false;
    Command root("light");
    root.flags().boolVar(verbose, 'v', "verbose", false, "verbose");
    Command off("off");
    off.exec([&](Command&, const Args&) -> std::optional<Error> {
        ran = true;
        return std::nullopt;
    });
    root.addCommand(std::move(off));

    ASSERT_FALSE(root.parseAndRun({"--verbose", "off"}).has_value());
    EXPECT_TRUE(verbose);
    EXPECT_TRUE(ran);
}
