#ifndef CMDTREE_HOOKS_HPP
#define CMDTREE_HOOKS_HPP

#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "context.hpp"
#include "exit_code.hpp"
#include "model.hpp"

namespace cmdtree {

enum class HookState {
    Idle,
    BeforeHooksRunning,
    Cancelled,
    ActionRunning,
    AfterHooksRunning,
    ErrorHooksRunning,
    Done,
};

const char* hookStateName(HookState s);

// Thrown by an action body that stops early because its cancellation token fired.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what = "operation was cancelled") : std::runtime_error(what) {}
};

struct ExecutionOutcome {
    int exitCode{0};
    bool actionInvoked{false};
    bool cancelled{false};
    bool exceptionHandled{false};
    std::string terminationReason;
    std::optional<ActionResult> result;
};

// Runs before hooks, the action, then after or error hooks for one resolved invocation.
// Command-level hooks (outermost command first) precede action-level hooks; within each
// level hooks run by ascending `order`, then declaration order.
class HookOrchestrator {
public:
    using TransitionObserver = std::function<void(HookState)>;

    HookOrchestrator(std::vector<const CommandNode*> path, const ActionNode& action);

    HookOrchestrator& cancelledCode(int code) {
        cancelledCode_ = code;
        return *this;
    }
    HookOrchestrator& onTransition(TransitionObserver observer) {
        observer_ = std::move(observer);
        return *this;
    }

    // Exceptions that no error hook handles propagate unchanged.
    ExecutionOutcome run(HookContext& hooks, ActionContext& action);

    [[nodiscard]] HookState state() const { return state_; }
    [[nodiscard]] std::vector<const HookSpec*> hooksFor(HookPhase phase) const;

    // Searches the action's mappings, then each command from innermost outward. The most
    // derived matching exception type wins; ties go to the mapping found first.
    [[nodiscard]] std::optional<int> mapException(const std::exception& ex) const;

private:
    void enter(HookState s);

    std::vector<const CommandNode*> path_;
    const ActionNode* action_;
    int cancelledCode_{toInt(ExitCode::Cancelled)};
    TransitionObserver observer_;
    HookState state_{HookState::Idle};
};

} // namespace cmdtree

#endif // CMDTREE_HOOKS_HPP
