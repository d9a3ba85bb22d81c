#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "cmdtree/cmdtree.hpp"

namespace {

class FileNotFound : public std::runtime_error {
public:
    explicit FileNotFound(const std::string& path) : std::runtime_error("file not found: " + path) {}
};

class ConfigMissing : public FileNotFound {
public:
    using FileNotFound::FileNotFound;
};

} // namespace

int main(int argc, char** argv) {
    cmdtree::CommandNode tool("tool", "Exit code mapping example");
    tool.mapException<FileNotFound>(cmdtree::ExitCode::FileNotFound);
    tool.mapException<std::system_error>(cmdtree::ExitCode::IOError);
    tool.onError("log", [](cmdtree::HookContext& ctx, const std::exception& ex) {
        std::cerr << ctx.actionName << " failed: " << ex.what() << "\n";
        return true;
    });

    tool.addAction(cmdtree::ActionNode("read", "Read a file")
                       .addParameter(cmdtree::ParameterSpec::argument("path").required())
                       .action([](cmdtree::ActionContext& ctx) -> int {
                           throw FileNotFound(ctx.params.get<std::string>("path"));
                       }));
    tool.addAction(cmdtree::ActionNode("configure", "Load configuration")
                       .mapException<ConfigMissing>(cmdtree::ExitCode::ConfigurationError)
                       .action([](cmdtree::ActionContext&) -> int { throw ConfigMissing("app.conf"); }));

    cmdtree::CommandNode root("myapp");
    root.addCommand(std::move(tool));

    cmdtree::Dispatcher app(std::move(root));
    return app.run(argc, argv);
}
