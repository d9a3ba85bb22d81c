#include "cmdtree/dispatcher.hpp"

#include <stdexcept>

#include "cmdtree/help.hpp"
#include "cmdtree/utils.hpp"

namespace cmdtree {

Dispatcher::Dispatcher(CommandNode root, std::vector<ParameterSpec> globals, ConversionRegistry converters)
    : root_(std::move(root)), globals_(std::move(globals)), converters_(std::move(converters)) {
    if (auto err = validateModel(root_, converters_, globals_)) throw std::invalid_argument("invalid command tree: " + *err);
}

int Dispatcher::run(int argc, char** argv, CancellationToken token) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return dispatch(args, std::move(token));
}

int Dispatcher::dispatch(const std::vector<std::string>& args, CancellationToken token) {
    return dispatchDetailed(args, std::move(token)).exitCode;
}

DispatchResult Dispatcher::dispatchDetailed(const std::vector<std::string>& args, CancellationToken token) {
    ResolveOptions resolveOpts;
    resolveOpts.commandDistance = commandDistance_;
    resolveOpts.actionDistance = actionDistance_;
    resolveOpts.globals = &globals_;

    Resolution resolution;
    auto diagnostic = resolve(root_, args, resolution, resolveOpts);

    if (helpRequested(args, resolution)) return showHelp(resolution);
    if (helpEnabled_ && args.empty() && diagnostic && diagnostic->kind == ErrorKind::NoActionSpecified) {
        return showHelp(resolution);
    }
    if (diagnostic) return fail(std::move(*diagnostic), resolution.commandPath());

    const ActionNode& action = *resolution.action;
    const auto usagePath = joinPath(resolution.path, &action);
    traceLine("resolved " + usagePath);

    BindOptions bindOpts;
    bindOpts.converters = &converters_;
    bindOpts.environment = environment_;
    bindOpts.prompter = prompter_ ? prompter_ : &terminalPrompter_;
    bindOpts.interactive = interactive_.value_or(isInteractive());
    bindOpts.optionDistance = optionDistance_;
    bindOpts.globals = &globals_;

    ParameterValues params;
    std::vector<std::string> globalTokens = resolution.globalTokens;
    if (auto err = Binder(bindOpts).bind(action.parameters(), resolution.remaining, params, &globalTokens)) {
        return fail(std::move(*err), usagePath);
    }

    bindOpts.globals = nullptr;
    ParameterValues globalValues;
    if (auto err = Binder(bindOpts).bind(globals_, globalTokens, globalValues)) return fail(std::move(*err), usagePath);

    traceValues("global", globals_, globalValues);
    traceValues("parameter", action.parameters(), params);

    HookContext hooks;
    hooks.commandPath = resolution.commandNames();
    hooks.actionName = action.name();
    hooks.arguments = resolution.remaining;
    hooks.parameters = &params;
    hooks.globals = &globalValues;
    hooks.token = token;

    ActionContext actionCtx{params, globalValues, hooks, token, out(), err()};

    HookOrchestrator orchestrator(resolution.path, action);
    orchestrator.cancelledCode(cancelledCode_);
    if (trace_) orchestrator.onTransition([this](HookState s) { traceLine(std::string("state ") + hookStateName(s)); });

    const auto outcome = orchestrator.run(hooks, actionCtx);

    DispatchResult result;
    result.exitCode = outcome.exitCode;
    result.actionInvoked = outcome.actionInvoked;
    result.terminationReason = outcome.terminationReason;
    if (outcome.cancelled) {
        Diagnostic d;
        d.kind = ErrorKind::ExecutionCancelled;
        d.message = outcome.terminationReason;
        if (diagnosticHandler_) diagnosticHandler_(d);
        if (!silenceErrors_ && !d.message.empty()) err() << "Cancelled: " << d.message << "\n";
        result.diagnostic = std::move(d);
    } else if (outcome.exceptionHandled) {
        Diagnostic d;
        d.kind = ErrorKind::ExecutionFailed;
        d.message = outcome.terminationReason;
        if (diagnosticHandler_) diagnosticHandler_(d);
        result.diagnostic = std::move(d);
    }
    traceLine("exit code " + std::to_string(result.exitCode));
    return result;
}

bool Dispatcher::helpRequested(const std::vector<std::string>& args, const Resolution& r) const {
    if (!helpEnabled_) return false;

    bool shortClaimed = false;
    const auto claims = [&shortClaimed](const std::vector<ParameterSpec>& specs) {
        for (const auto& p : specs) {
            if (p.isOption() && p.shortName() == 'h') shortClaimed = true;
        }
    };
    claims(globals_);
    if (r.action) claims(r.action->parameters());

    for (const auto& a : args) {
        if (a == "--") break;
        if (a == "--help") return true;
        if (a == "-h" && !shortClaimed) return true;
    }
    return false;
}

DispatchResult Dispatcher::showHelp(const Resolution& r) {
    HelpRenderer renderer(converters_, globals_);
    if (r.action && r.actionNamed) {
        renderer.printActionHelp(out(), r.path, *r.action);
    } else {
        renderer.printCommandHelp(out(), r.path);
    }
    DispatchResult result;
    result.helpShown = true;
    return result;
}

DispatchResult Dispatcher::fail(Diagnostic diagnostic, const std::string& usagePath) {
    if (diagnosticHandler_) diagnosticHandler_(diagnostic);

    if (!silenceErrors_) {
        std::string msg = diagnostic.message;
        if (!diagnostic.suggestions.empty()) {
            msg += "\n\nDid you mean this?\n";
            for (const auto& s : diagnostic.suggestions) msg += "  " + s + "\n";
        }
        err() << "Error: " << msg << "\n";
        if (helpEnabled_) err() << "Run '" << usagePath << " --help' for usage.\n";
    }

    DispatchResult result;
    result.exitCode = diagnostic.isUsageError() ? usageErrorCode_ : toInt(ExitCode::Error);
    result.terminationReason = diagnostic.message;
    result.diagnostic = std::move(diagnostic);
    return result;
}

void Dispatcher::traceLine(const std::string& line) const {
    if (trace_) err() << "[cmdtree] " << line << "\n";
}

void Dispatcher::traceValues(const char* label, const std::vector<ParameterSpec>& specs, const ParameterValues& values) const {
    if (!trace_) return;
    for (const auto& p : specs) {
        const auto* entry = values.find(p.name());
        if (!entry) continue;
        traceLine(std::string(label) + " " + p.name() + " = " + converters_.format(p.type(), entry->value) + " (" +
                  sourceName(entry->source) + ")");
    }
}

} // namespace cmdtree
