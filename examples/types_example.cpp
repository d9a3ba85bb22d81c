#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

namespace {

enum class Level { Debug, Info, Warning, Error };
enum class Access { None = 0, Read = 1, Write = 2, Execute = 4 };

} // namespace

int main(int argc, char** argv) {
    using cmdtree::ParameterSpec;
    using cmdtree::TypeDescriptor;

    cmdtree::ConversionRegistry registry;
    registry.addEnum(cmdtree::EnumSpec::of<Level>(
        "level", {{"Debug", Level::Debug}, {"Info", Level::Info}, {"Warning", Level::Warning}, {"Error", Level::Error}}));
    registry.addEnum(cmdtree::EnumSpec::of<Access>(
        "access", {{"None", Access::None}, {"Read", Access::Read}, {"Write", Access::Write}, {"Execute", Access::Execute}},
        true));

    cmdtree::CommandNode root("types", "Typed parameters");
    root.addAction(
        cmdtree::ActionNode("show", "Print converted values")
            .primary()
            .addParameter(ParameterSpec::option("levels", TypeDescriptor::listOf("level")).shortName('l'))
            .addParameter(ParameterSpec::option("access", TypeDescriptor::scalar("access")).defaultValue("Read"))
            .addParameter(ParameterSpec::option("port", TypeDescriptor::scalar(cmdtree::types::Int))
                              .defaultValue("8080")
                              .envVar("TYPES_PORT")
                              .addRule(cmdtree::rules::range(1, 65535)))
            .addParameter(ParameterSpec::option("name").addRule(cmdtree::rules::pattern("[a-z][a-z0-9-]*")))
            .addParameter(ParameterSpec::option("json", TypeDescriptor::scalar(cmdtree::types::Bool)).exclusiveGroup("format"))
            .addParameter(ParameterSpec::option("xml", TypeDescriptor::scalar(cmdtree::types::Bool)).exclusiveGroup("format"))
            .addParameter(ParameterSpec::option("limit", TypeDescriptor::scalar(cmdtree::types::Bytes)).defaultValue("1MiB"))
            .addParameter(ParameterSpec::argument("files", TypeDescriptor::listOf(cmdtree::types::Path)))
            .action([](cmdtree::ActionContext& ctx) {
                for (const auto& l : ctx.params.getList<cmdtree::EnumValue>("levels")) ctx.out << "level " << l.value << "\n";
                ctx.out << "access " << ctx.params.get<cmdtree::EnumValue>("access").value << "\n";
                ctx.out << "port " << ctx.params.get<int>("port") << "\n";
                ctx.out << "limit " << ctx.params.get<std::uint64_t>("limit") << " bytes\n";
                for (const auto& f : ctx.params.getList<std::filesystem::path>("files")) ctx.out << "file " << f.string() << "\n";
            }));

    cmdtree::Dispatcher app(std::move(root), {}, std::move(registry));
    return app.run(argc, argv);
}
