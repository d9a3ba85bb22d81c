#include <cstdlib>
#include <future>
#include <iostream>
#include <string>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    cmdtree::CommandNode deploy("deploy", "Deploy the service");
    deploy.before("auth", [](cmdtree::HookContext& ctx) {
        if (!std::getenv("DEPLOY_TOKEN")) ctx.cancel("Authentication required");
    });
    deploy.before("timer", [](cmdtree::HookContext& ctx) { ctx.set("started", std::string("now")); }, -1);
    deploy.after("report", [](cmdtree::HookContext& ctx, const cmdtree::ActionResult& result) {
        std::cout << "deploy finished with " << result.exitCode.value_or(0) << " (" << ctx.actionName << ")\n";
    });

    deploy.addAction(cmdtree::ActionNode("run", "Roll out a release")
                         .primary()
                         .addParameter(cmdtree::ParameterSpec::option("environment").shortName('e').required())
                         .addParameter(cmdtree::ParameterSpec::option("region").defaultValue("us-east"))
                         .before("check-env",
                                 [](cmdtree::HookContext& ctx) {
                                     return std::async(std::launch::async, [&ctx] {
                                         if (ctx.parameters->get<std::string>("environment") == "prod" &&
                                             !ctx.token.canBeCancelled()) {
                                             std::cerr << "warning: production deploy without a cancellation source\n";
                                         }
                                     });
                                 })
                         .action([](cmdtree::ActionContext& ctx) {
                             ctx.out << "deploying to " << ctx.params.get<std::string>("environment") << " in "
                                     << ctx.params.get<std::string>("region") << "\n";
                         }));

    cmdtree::CommandNode root("myapp", "Hooks example");
    root.addCommand(std::move(deploy));

    cmdtree::Dispatcher app(std::move(root));
    cmdtree::CancellationSource cancel;
    return app.run(argc, argv, cancel.token());
}
