#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cmdtree/resolver.hpp"

using namespace cmdtree;

namespace {

ActionNode noop(const std::string& name) {
    ActionNode a(name);
    a.action([](ActionContext&) {});
    return a;
}

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root.addCommand(CommandNode("git", "Version control")
                            .addAction(noop("commit").addAlias("ci"))
                            .addAction(noop("push"))
                            .addAction(noop("pull"))
                            .addAction(noop("gc").hidden()));
        root.addCommand(CommandNode("build").addAction(noop("all").primary()));
        root.addCommand(CommandNode("deploy")
                            .addAction(noop("run").primary().addParameter(ParameterSpec::argument("target")))
                            .addAction(noop("rollback")));
        root.addCommand(CommandNode("debug").hidden().addAction(noop("dump").primary()));

        globals.push_back(ParameterSpec::flag("verbose").shortName('v'));
        globals.push_back(ParameterSpec::option("config"));
        options.globals = &globals;
    }

    std::optional<Diagnostic> run(const std::vector<std::string>& tokens) { return resolve(root, tokens, resolution, options); }

    CommandNode root{"app"};
    std::vector<ParameterSpec> globals;
    ResolveOptions options;
    Resolution resolution;
};

} // namespace

TEST_F(ResolverTest, ResolvesCommandAndAction) {
    ASSERT_FALSE(run({"git", "commit", "-m", "fix"}));
    EXPECT_EQ(resolution.commandPath(), "app git");
    ASSERT_NE(resolution.action, nullptr);
    EXPECT_EQ(resolution.action->name(), "commit");
    EXPECT_TRUE(resolution.actionNamed);
    EXPECT_EQ(resolution.remaining, (std::vector<std::string>{"-m", "fix"}));
}

TEST_F(ResolverTest, MatchingIsCaseInsensitiveAndHonoursAliases) {
    ASSERT_FALSE(run({"GIT", "CI"}));
    ASSERT_NE(resolution.action, nullptr);
    EXPECT_EQ(resolution.action->name(), "commit");
    EXPECT_TRUE(resolution.remaining.empty());
}

TEST_F(ResolverTest, PrimaryActionTakesRemainingTokens) {
    ASSERT_FALSE(run({"deploy", "--region", "us-east"}));
    ASSERT_NE(resolution.action, nullptr);
    EXPECT_EQ(resolution.action->name(), "run");
    EXPECT_FALSE(resolution.actionNamed);
    EXPECT_EQ(resolution.remaining, (std::vector<std::string>{"--region", "us-east"}));

    ASSERT_FALSE(run({"deploy", "prod"}));
    EXPECT_EQ(resolution.action->name(), "run");
    EXPECT_EQ(resolution.remaining, std::vector<std::string>{"prod"});

    ASSERT_FALSE(run({"deploy", "rollback"}));
    EXPECT_EQ(resolution.action->name(), "rollback");
    EXPECT_TRUE(resolution.actionNamed);
}

TEST_F(ResolverTest, BareWordIsNotForcedOnPrimaryWithoutPositionals) {
    const auto d = run({"build", "everything"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownAction);
    EXPECT_EQ(d->message, "unknown action \"everything\" for \"app build\"");

    ASSERT_FALSE(run({"build", "--jobs", "4"}));
    EXPECT_EQ(resolution.action->name(), "all");
    EXPECT_EQ(resolution.remaining, (std::vector<std::string>{"--jobs", "4"}));
}

TEST_F(ResolverTest, UnknownCommandWinsOverRootPrimaryWithoutPositionals) {
    root.addAction(noop("main").primary());

    const auto d = run({"buld"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownCommand);
    EXPECT_EQ(d->message, "unknown command \"buld\" for \"app\"");
    EXPECT_EQ(d->suggestions, std::vector<std::string>{"build"});

    ASSERT_FALSE(run({}));
    EXPECT_EQ(resolution.action->name(), "main");
}

TEST_F(ResolverTest, RootPrimaryWithPositionalTakesUnknownWord) {
    root.addAction(noop("open").primary().addParameter(ParameterSpec::argument("file")));

    ASSERT_FALSE(run({"notes.txt"}));
    EXPECT_EQ(resolution.action->name(), "open");
    EXPECT_FALSE(resolution.actionNamed);
    EXPECT_EQ(resolution.remaining, std::vector<std::string>{"notes.txt"});
}

TEST_F(ResolverTest, TerminatorStopsCommandWalk) {
    ASSERT_FALSE(run({"deploy", "--", "rollback"}));
    EXPECT_EQ(resolution.action->name(), "run");
    EXPECT_EQ(resolution.remaining, (std::vector<std::string>{"--", "rollback"}));
}

TEST_F(ResolverTest, MissingActionIsReported) {
    const auto d = run({"git"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::NoActionSpecified);
    EXPECT_EQ(d->message, "no action specified for \"app git\"");
    EXPECT_EQ(d->expected, "one of: commit, push, pull");
    EXPECT_EQ(resolution.commandPath(), "app git");
}

TEST_F(ResolverTest, UnknownCommandSuggestsSimilarNames) {
    const auto d = run({"buld"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownCommand);
    EXPECT_EQ(d->message, "unknown command \"buld\" for \"app\"");
    EXPECT_EQ(d->found, "buld");
    EXPECT_EQ(d->suggestions, std::vector<std::string>{"build"});
    EXPECT_TRUE(d->isUsageError());
}

TEST_F(ResolverTest, UnknownActionSuggestsSimilarNames) {
    const auto d = run({"git", "comit"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownAction);
    EXPECT_EQ(d->message, "unknown action \"comit\" for \"app git\"");
    EXPECT_EQ(d->suggestions, std::vector<std::string>{"commit"});
}

TEST_F(ResolverTest, HiddenNodesResolveButAreNeverSuggested) {
    ASSERT_FALSE(run({"debug"}));
    EXPECT_EQ(resolution.action->name(), "dump");
    ASSERT_FALSE(run({"git", "gc"}));
    EXPECT_EQ(resolution.action->name(), "gc");

    const auto d = run({"debg"});
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->suggestions.empty());

    const auto g = run({"git", "gcgc"});
    ASSERT_TRUE(g.has_value());
    EXPECT_TRUE(g->suggestions.empty());
}

TEST_F(ResolverTest, NothingCloseMeansNoSuggestions) {
    const auto d = run({"xyzzy"});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownCommand);
    EXPECT_TRUE(d->suggestions.empty());
}

TEST_F(ResolverTest, GlobalOptionsMayPrecedeCommands) {
    ASSERT_FALSE(run({"--verbose", "git", "--config", "app.yml", "push", "origin"}));
    EXPECT_EQ(resolution.action->name(), "push");
    EXPECT_EQ(resolution.globalTokens, (std::vector<std::string>{"--verbose", "--config", "app.yml"}));
    EXPECT_EQ(resolution.remaining, std::vector<std::string>{"origin"});
}

TEST_F(ResolverTest, UnknownActionAtRootWithoutChildren) {
    CommandNode tool("tool");
    tool.addAction(noop("start")).addAction(noop("stop"));
    Resolution r;
    const auto d = resolve(tool, {"strat"}, r);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, ErrorKind::UnknownAction);
    EXPECT_EQ(d->suggestions, std::vector<std::string>{"start"});
}

TEST_F(ResolverTest, Candidates) {
    EXPECT_EQ(commandCandidates(root), (std::vector<std::string>{"git", "build", "deploy"}));
    EXPECT_EQ(actionCandidates(*root.findChild("git")), (std::vector<std::string>{"commit", "ci", "push", "pull"}));
}
