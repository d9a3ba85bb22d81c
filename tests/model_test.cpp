#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

#include "cmdtree/model.hpp"

using namespace cmdtree;

namespace {

class NotFound : public std::runtime_error {
public:
    NotFound() : std::runtime_error("not found") {}
};

class ConfigNotFound : public NotFound {};

ActionNode noop(const std::string& name) {
    ActionNode a(name);
    a.action([](ActionContext&) {});
    return a;
}

} // namespace

TEST(ModelTest, ParameterSpecBuilders) {
    auto p = ParameterSpec::option("message", TypeDescriptor::scalar(types::String))
                 .shortName('m')
                 .required()
                 .envVar("MSG")
                 .prompt("Message: ", true)
                 .exclusiveGroup("body")
                 .description("Commit message");
    EXPECT_TRUE(p.isOption());
    EXPECT_EQ(p.kind(), ParameterKind::Option);
    EXPECT_EQ(p.shortName(), 'm');
    EXPECT_TRUE(p.isRequired());
    EXPECT_EQ(p.envVar(), "MSG");
    EXPECT_EQ(p.prompt(), "Message: ");
    EXPECT_TRUE(p.isSecurePrompt());
    EXPECT_EQ(p.exclusiveGroup(), "body");
    EXPECT_EQ(p.displayName(), "--message");

    const auto flag = ParameterSpec::flag("amend");
    EXPECT_TRUE(flag.type().isBool());
    EXPECT_FALSE(flag.isRequired());

    const auto arg = ParameterSpec::argument("files", TypeDescriptor::listOf(types::Path));
    EXPECT_FALSE(arg.isOption());
    EXPECT_TRUE(arg.type().collection);
    EXPECT_EQ(arg.displayName(), "<files>");
}

TEST(ModelTest, NamesAndAliasesMatchCaseInsensitively) {
    CommandNode root("app");
    root.addCommand(CommandNode("remote").aliases({"rm"}).addAction(noop("list").addAlias("ls")));

    const auto* remote = root.findChild("REMOTE");
    ASSERT_NE(remote, nullptr);
    EXPECT_EQ(root.findChild("Rm"), remote);
    EXPECT_EQ(root.findChild("rem"), nullptr);

    const auto* list = remote->findAction("LS");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->name(), "list");
}

TEST(ModelTest, PrimaryAction) {
    CommandNode cmd("build");
    cmd.addAction(noop("debug")).addAction(noop("release").primary());
    ASSERT_NE(cmd.primaryAction(), nullptr);
    EXPECT_EQ(cmd.primaryAction()->name(), "release");
    EXPECT_EQ(CommandNode("empty").primaryAction(), nullptr);
}

TEST(ModelTest, ValidTreePasses) {
    CommandNode root("app");
    root.addCommand(CommandNode("git")
                        .addAction(noop("commit")
                                       .addParameter(ParameterSpec::option("message").shortName('m').required())
                                       .addParameter(ParameterSpec::flag("amend")))
                        .addAction(noop("push").addParameter(ParameterSpec::argument("refs", TypeDescriptor::listOf(types::String)))));
    EXPECT_FALSE(validateModel(root, ConversionRegistry{}));
}

TEST(ModelTest, DuplicateSiblingNamesAreRejected) {
    CommandNode root("app");
    root.addCommand(CommandNode("build")).addCommand(CommandNode("Build"));
    const auto err = validateModel(root, ConversionRegistry{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "command 'app' has more than one child named 'Build'");
}

TEST(ModelTest, ActionAliasClashingWithSiblingIsRejected) {
    CommandNode root("app");
    root.addAction(noop("status").addAlias("st")).addAction(noop("stash").addAlias("ST"));
    const auto err = validateModel(root, ConversionRegistry{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "command 'app' has more than one action named 'ST'");
}

TEST(ModelTest, CommandAliasesAreUniqueAcrossTree) {
    CommandNode root("app");
    root.addCommand(CommandNode("alpha").addCommand(CommandNode("inner").addAlias("x")))
        .addCommand(CommandNode("beta").addAlias("x"));
    const auto err = validateModel(root, ConversionRegistry{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "alias 'x' is used more than once");
}

TEST(ModelTest, MoreThanOnePrimaryActionIsRejected) {
    CommandNode root("app");
    root.addAction(noop("a").primary()).addAction(noop("b").primary());
    const auto err = validateModel(root, ConversionRegistry{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "command 'app' has more than one primary action ('a', 'b')");
}

TEST(ModelTest, ParameterInvariants) {
    {
        CommandNode root("app");
        root.addAction(noop("run").addParameter(ParameterSpec::option("v")).addParameter(ParameterSpec::option("V")));
        EXPECT_EQ(validateModel(root, ConversionRegistry{}), std::optional<std::string>("'app run' declares parameter 'V' more than once"));
    }
    {
        CommandNode root("app");
        root.addAction(noop("run")
                           .addParameter(ParameterSpec::option("verbose").shortName('v'))
                           .addParameter(ParameterSpec::option("version").shortName('v')));
        EXPECT_EQ(validateModel(root, ConversionRegistry{}), std::optional<std::string>("'app run' declares short name '-v' more than once"));
    }
    {
        CommandNode root("app");
        root.addAction(noop("run").addParameter(ParameterSpec::option("level").required().defaultValue("1")));
        EXPECT_EQ(validateModel(root, ConversionRegistry{}),
                  std::optional<std::string>("parameter 'level' of 'app run' is required and has a default value"));
    }
    {
        CommandNode root("app");
        root.addAction(noop("run").addParameter(ParameterSpec::option("color", TypeDescriptor::scalar("color"))));
        EXPECT_EQ(validateModel(root, ConversionRegistry{}),
                  std::optional<std::string>("parameter 'color' of 'app run' has unknown type 'color'"));
    }
    {
        CommandNode root("app");
        root.addAction(noop("copy")
                           .addParameter(ParameterSpec::argument("sources", TypeDescriptor::listOf(types::Path)))
                           .addParameter(ParameterSpec::argument("target", TypeDescriptor::scalar(types::Path))));
        EXPECT_EQ(validateModel(root, ConversionRegistry{}),
                  std::optional<std::string>("'app copy' declares argument 'target' after a collection argument"));
    }
}

TEST(ModelTest, GlobalsMustBeOptions) {
    CommandNode root("app");
    const auto err = validateModel(root, ConversionRegistry{}, {ParameterSpec::argument("file")});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "global parameter 'file' must be an option");
}

TEST(ModelTest, DuplicateExceptionMappingIsRejected) {
    CommandNode root("app");
    root.addAction(noop("run")
                       .addExitCode(ExitCodeMapping::of<NotFound>(3, "not-found"))
                       .addExitCode(ExitCodeMapping::of<NotFound>(4, "not-found")));
    const auto err = validateModel(root, ConversionRegistry{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "'app run' maps exception 'not-found' more than once");
}

TEST(ModelTest, ExitCodeMappingMatchesDerivedTypes) {
    const auto base = ExitCodeMapping::of<NotFound>(ExitCode::FileNotFound);
    const auto derived = ExitCodeMapping::of<ConfigNotFound>(ExitCode::ConfigurationError);
    const auto generic = ExitCodeMapping::of<std::exception>(ExitCode::Error);

    EXPECT_EQ(base.exitCode(), 3);
    EXPECT_TRUE(base.matches(ConfigNotFound{}));
    EXPECT_TRUE(base.matches(NotFound{}));
    EXPECT_FALSE(derived.matches(NotFound{}));
    EXPECT_FALSE(base.matches(std::logic_error("x")));

    EXPECT_TRUE(derived.isMoreDerivedThan(base));
    EXPECT_TRUE(base.isMoreDerivedThan(generic));
    EXPECT_FALSE(base.isMoreDerivedThan(derived));
    EXPECT_FALSE(base.isMoreDerivedThan(base));
    EXPECT_FALSE(ExitCodeMapping::of<std::system_error>(74).isMoreDerivedThan(base));
}
