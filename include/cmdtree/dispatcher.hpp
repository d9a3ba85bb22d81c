#ifndef CMDTREE_DISPATCHER_HPP
#define CMDTREE_DISPATCHER_HPP

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "binder.hpp"
#include "context.hpp"
#include "diagnostic.hpp"
#include "exit_code.hpp"
#include "hooks.hpp"
#include "model.hpp"
#include "prompt.hpp"
#include "resolver.hpp"
#include "types.hpp"

namespace cmdtree {

struct DispatchResult {
    int exitCode{0};
    std::optional<Diagnostic> diagnostic;
    std::string terminationReason;
    bool actionInvoked{false};
    bool helpShown{false};
};

// Owns a command tree and turns argument vectors into action invocations.
class Dispatcher {
public:
    using DiagnosticHandler = std::function<void(const Diagnostic&)>;

    // Throws std::invalid_argument when the tree breaks a structural invariant (see validateModel).
    explicit Dispatcher(CommandNode root,
                        std::vector<ParameterSpec> globals = {},
                        ConversionRegistry converters = ConversionRegistry{});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Dispatcher& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }
    Dispatcher& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }
    Dispatcher& silenceErrors(bool v = true) {
        silenceErrors_ = v;
        return *this;
    }
    Dispatcher& usageErrorCode(int code) {
        usageErrorCode_ = code;
        return *this;
    }
    Dispatcher& cancelledCode(int code) {
        cancelledCode_ = code;
        return *this;
    }
    Dispatcher& commandSuggestionDistance(std::size_t d) {
        commandDistance_ = d;
        return *this;
    }
    Dispatcher& actionSuggestionDistance(std::size_t d) {
        actionDistance_ = d;
        return *this;
    }
    Dispatcher& optionSuggestionDistance(std::size_t d) {
        optionDistance_ = d;
        return *this;
    }
    Dispatcher& setEnvironment(EnvironmentLookup lookup) {
        environment_ = std::move(lookup);
        return *this;
    }
    // The prompter must outlive the dispatcher.
    Dispatcher& setPrompter(Prompter& p) {
        prompter_ = &p;
        return *this;
    }
    // Overrides terminal detection for prompts.
    Dispatcher& interactive(bool v) {
        interactive_ = v;
        return *this;
    }
    Dispatcher& trace(bool v = true) {
        trace_ = v;
        return *this;
    }
    Dispatcher& enableHelp(bool v = true) {
        helpEnabled_ = v;
        return *this;
    }
    Dispatcher& onDiagnostic(DiagnosticHandler h) {
        diagnosticHandler_ = std::move(h);
        return *this;
    }

    // Fixed at construction; the tree is checked against it there.
    [[nodiscard]] const ConversionRegistry& converters() const { return converters_; }
    [[nodiscard]] const CommandNode& root() const { return root_; }
    [[nodiscard]] const std::vector<ParameterSpec>& globals() const { return globals_; }

    // argv[0] is the program name and is skipped.
    int run(int argc, char** argv, CancellationToken token = {});
    int dispatch(const std::vector<std::string>& args, CancellationToken token = {});
    DispatchResult dispatchDetailed(const std::vector<std::string>& args, CancellationToken token = {});

private:
    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    bool helpRequested(const std::vector<std::string>& args, const Resolution& r) const;
    DispatchResult showHelp(const Resolution& r);
    DispatchResult fail(Diagnostic diagnostic, const std::string& usagePath);
    void traceLine(const std::string& line) const;
    void traceValues(const char* label, const std::vector<ParameterSpec>& specs, const ParameterValues& values) const;

    CommandNode root_;
    std::vector<ParameterSpec> globals_;
    ConversionRegistry converters_;

    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    bool silenceErrors_{false};
    int usageErrorCode_{toInt(ExitCode::Usage)};
    int cancelledCode_{toInt(ExitCode::Cancelled)};
    std::size_t commandDistance_{3};
    std::size_t actionDistance_{2};
    std::size_t optionDistance_{2};
    EnvironmentLookup environment_{processEnvironment};
    TerminalPrompter terminalPrompter_;
    Prompter* prompter_{nullptr};
    std::optional<bool> interactive_;
    bool trace_{false};
    bool helpEnabled_{true};
    DiagnosticHandler diagnosticHandler_;
};

} // namespace cmdtree

#endif // CMDTREE_DISPATCHER_HPP
