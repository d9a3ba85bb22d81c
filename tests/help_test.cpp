#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cmdtree/help.hpp"

using namespace cmdtree;

namespace {

class HelpTest : public ::testing::Test {
protected:
    HelpTest() {
        CommandNode git("git", "Version control");
        git.addAlias("g");
        git.addAction(ActionNode("commit", "Record changes")
                          .addAlias("ci")
                          .addParameter(ParameterSpec::option("message").shortName('m').required().description("Commit message"))
                          .addParameter(ParameterSpec::flag("amend"))
                          .addParameter(ParameterSpec::option("count", TypeDescriptor::scalar(types::Int)).defaultValue("1").envVar("COUNT"))
                          .addParameter(ParameterSpec::argument("files", TypeDescriptor::listOf(types::Path))));
        git.addAction(ActionNode("push", "Update remote refs").primary());
        git.addAction(ActionNode("gc", "Housekeeping").hidden());

        root.addCommand(CommandNode("zeta", "Last one"));
        root.addCommand(std::move(git));
        root.addCommand(CommandNode("secret").hidden());

        globals.push_back(ParameterSpec::flag("verbose").shortName('v').description("Verbose output"));
    }

    const CommandNode& git() const { return *root.findChild("git"); }

    CommandNode root{"app", "Test application"};
    std::vector<ParameterSpec> globals;
    ConversionRegistry registry;
};

} // namespace

TEST_F(HelpTest, RootHelpListsVisibleCommandsSorted) {
    std::ostringstream os;
    HelpRenderer(registry, globals).printCommandHelp(os, {&root});
    EXPECT_EQ(os.str(),
              "Usage: app [command] [options]\n"
              "\n"
              "Test application\n"
              "\n"
              "Commands:\n"
              "  git, g - Version control\n"
              "  zeta - Last one\n"
              "\n"
              "Options:\n"
              "  -h, --help - Help for app\n"
              "\n"
              "Global Options:\n"
              "  -v, --verbose - Verbose output\n");
}

TEST_F(HelpTest, CommandHelpListsActionsAndMarksPrimary) {
    std::ostringstream os;
    HelpRenderer(registry, {}).printCommandHelp(os, {&root, &git()});
    EXPECT_EQ(os.str(),
              "Usage: app git [action] [options]\n"
              "\n"
              "Version control\n"
              "\n"
              "Actions:\n"
              "  commit, ci - Record changes\n"
              "  push - Update remote refs (default)\n"
              "\n"
              "Options:\n"
              "  -h, --help - Help for git\n");
}

TEST_F(HelpTest, ActionHelpDescribesParameters) {
    std::ostringstream os;
    HelpRenderer(registry, globals).printActionHelp(os, {&root, &git()}, *git().findAction("commit"));
    EXPECT_EQ(os.str(),
              "Usage: app git commit [options] [<files>...]\n"
              "\n"
              "Record changes\n"
              "\n"
              "Aliases: ci\n"
              "\n"
              "Arguments:\n"
              "  <files> list of path\n"
              "\n"
              "Options:\n"
              "  -m, --message string - Commit message (required)\n"
              "  --amend\n"
              "  --count int - (default: 1) (env: COUNT)\n"
              "  -h, --help - Help for commit\n"
              "\n"
              "Global Options:\n"
              "  -v, --verbose - Verbose output\n");
}

TEST_F(HelpTest, UsageLineForRequiredArgument) {
    ActionNode copy("copy");
    copy.addParameter(ParameterSpec::argument("source").required()).addParameter(ParameterSpec::argument("target"));
    EXPECT_EQ(HelpRenderer(registry, globals).usageLine({&root}, &copy), "Usage: app copy [options] <source> [<target>]\n");
}

TEST_F(HelpTest, EnumParametersListTheirMembers) {
    enum class Color { Red, Green };
    registry.addEnum(EnumSpec::of<Color>("color", {{"Red", Color::Red}, {"Green", Color::Green}}));
    const auto p = ParameterSpec::option("color", TypeDescriptor::scalar("color")).defaultValue("Red");
    EXPECT_EQ(HelpRenderer(registry, globals).formatParameter(p), "--color one of: Red, Green - (default: Red)");
}

TEST_F(HelpTest, JoinPath) {
    EXPECT_EQ(joinPath({&root, &git()}), "app git");
    EXPECT_EQ(joinPath({&root, &git()}, git().findAction("push")), "app git push");
}
