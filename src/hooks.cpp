#include "cmdtree/hooks.hpp"

#include <algorithm>

namespace cmdtree {

namespace {

void appendSorted(const std::vector<HookSpec>& hooks, HookPhase phase, std::vector<const HookSpec*>& out) {
    std::vector<const HookSpec*> level;
    for (const auto& h : hooks) {
        if (h.phase == phase) level.push_back(&h);
    }
    std::stable_sort(level.begin(), level.end(), [](const HookSpec* a, const HookSpec* b) { return a->order < b->order; });
    out.insert(out.end(), level.begin(), level.end());
}

} // namespace

const char* hookStateName(HookState s) {
    switch (s) {
        case HookState::Idle: return "idle";
        case HookState::BeforeHooksRunning: return "before-hooks";
        case HookState::Cancelled: return "cancelled";
        case HookState::ActionRunning: return "action";
        case HookState::AfterHooksRunning: return "after-hooks";
        case HookState::ErrorHooksRunning: return "error-hooks";
        case HookState::Done: return "done";
    }
    return "done";
}

HookOrchestrator::HookOrchestrator(std::vector<const CommandNode*> path, const ActionNode& action)
    : path_(std::move(path)), action_(&action) {}

void HookOrchestrator::enter(HookState s) {
    state_ = s;
    if (observer_) observer_(s);
}

std::vector<const HookSpec*> HookOrchestrator::hooksFor(HookPhase phase) const {
    // Hooks of every command on the path sort as one level, outermost declarations first.
    std::vector<const HookSpec*> out;
    for (const auto* cmd : path_) {
        for (const auto& h : cmd->hooks()) {
            if (h.phase == phase) out.push_back(&h);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const HookSpec* a, const HookSpec* b) { return a->order < b->order; });

    appendSorted(action_->hooks(), phase, out);
    return out;
}

std::optional<int> HookOrchestrator::mapException(const std::exception& ex) const {
    const ExitCodeMapping* best = nullptr;
    const auto consider = [&](const std::vector<ExitCodeMapping>& mappings) {
        for (const auto& m : mappings) {
            if (!m.matches(ex)) continue;
            if (!best || m.isMoreDerivedThan(*best)) best = &m;
        }
    };

    consider(action_->exitCodes());
    for (auto it = path_.rbegin(); it != path_.rend(); ++it) consider((*it)->exitCodes());

    if (!best) return std::nullopt;
    return best->exitCode();
}

ExecutionOutcome HookOrchestrator::run(HookContext& hooks, ActionContext& action) {
    ExecutionOutcome outcome;

    enter(HookState::BeforeHooksRunning);
    for (const auto* h : hooksFor(HookPhase::Before)) {
        if (h->before) h->before(hooks);
    }

    if (!hooks.isCancelled() && hooks.token.isCancellationRequested()) hooks.cancel("operation was cancelled");
    if (hooks.isCancelled()) {
        enter(HookState::Cancelled);
        outcome.cancelled = true;
        outcome.exitCode = cancelledCode_;
        outcome.terminationReason = hooks.cancellationMessage();
        enter(HookState::Done);
        return outcome;
    }

    enter(HookState::ActionRunning);
    outcome.actionInvoked = true;
    ActionResult result;
    try {
        if (action_->handler()) result = action_->handler()(action);
    } catch (const OperationCancelled& ex) {
        hooks.cancel(ex.what());
        enter(HookState::Cancelled);
        outcome.cancelled = true;
        outcome.exitCode = cancelledCode_;
        outcome.terminationReason = hooks.cancellationMessage();
        enter(HookState::Done);
        return outcome;
    } catch (const std::exception& ex) {
        enter(HookState::ErrorHooksRunning);
        bool handled = false;
        for (const auto* h : hooksFor(HookPhase::OnError)) {
            if (h->onError && h->onError(hooks, ex)) {
                handled = true;
                break;
            }
        }
        if (!handled) throw;

        outcome.exceptionHandled = true;
        outcome.exitCode = mapException(ex).value_or(toInt(ExitCode::Error));
        outcome.terminationReason = ex.what();
        enter(HookState::Done);
        return outcome;
    }

    enter(HookState::AfterHooksRunning);
    for (const auto* h : hooksFor(HookPhase::After)) {
        if (h->after) h->after(hooks, result);
    }

    outcome.exitCode = result.exitCode.value_or(toInt(ExitCode::Success));
    outcome.result = std::move(result);
    enter(HookState::Done);
    return outcome;
}

} // namespace cmdtree
