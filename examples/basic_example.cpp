#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    using cmdtree::ParameterSpec;
    using cmdtree::TypeDescriptor;

    cmdtree::CommandNode git("git", "A tiny version control front-end");
    git.addAction(cmdtree::ActionNode("commit", "Record changes to the repository")
                      .addAlias("ci")
                      .addParameter(ParameterSpec::option("message").shortName('m').required().description("Commit message"))
                      .addParameter(ParameterSpec::flag("amend").description("Amend the previous commit"))
                      .action([](cmdtree::ActionContext& ctx) {
                          ctx.out << (ctx.params.get<bool>("amend") ? "amending: " : "committing: ")
                                  << ctx.params.get<std::string>("message") << "\n";
                      }));
    git.addAction(cmdtree::ActionNode("push", "Update remote refs")
                      .addParameter(ParameterSpec::argument("remote").defaultValue("origin"))
                      .addParameter(ParameterSpec::option("timeout", TypeDescriptor::scalar(cmdtree::types::Duration))
                                        .defaultValue("30s")
                                        .envVar("GIT_PUSH_TIMEOUT"))
                      .action([](cmdtree::ActionContext& ctx) {
                          const auto timeout = ctx.params.get<std::chrono::milliseconds>("timeout");
                          ctx.out << "pushing to " << ctx.params.get<std::string>("remote") << " (timeout " << timeout.count()
                                  << "ms)\n";
                          return cmdtree::ExitCode::Success;
                      }));

    cmdtree::CommandNode root("myapp", "Example application");
    root.addCommand(std::move(git));

    std::vector<ParameterSpec> globals;
    globals.push_back(ParameterSpec::flag("verbose").shortName('v').description("Trace dispatching"));

    cmdtree::Dispatcher app(std::move(root), std::move(globals));
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--verbose" || a == "-v") app.trace();
    }
    return app.run(argc, argv);
}
