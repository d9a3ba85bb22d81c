#ifndef CMDTREE_CONTEXT_HPP
#define CMDTREE_CONTEXT_HPP

#include <any>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "exit_code.hpp"
#include "value.hpp"

namespace cmdtree {

// Read side of a cancellation signal. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancellationRequested() const { return state_ && state_->load(); }
    [[nodiscard]] bool canBeCancelled() const { return state_ != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state) : state_(std::move(state)) {}

    std::shared_ptr<std::atomic<bool>> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { state_->store(true); }
    [[nodiscard]] bool isCancellationRequested() const { return state_->load(); }
    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

// What an action produced. An empty exitCode means "completed normally" (0).
struct ActionResult {
    std::optional<int> exitCode;
    std::any value;

    static ActionResult code(int c) {
        ActionResult r;
        r.exitCode = c;
        return r;
    }
    static ActionResult code(ExitCode c) { return code(toInt(c)); }
};

// Shared by every hook and the action of a single dispatch.
struct HookContext {
    std::vector<std::string> commandPath;
    std::string actionName;
    std::vector<std::string> arguments; // tokens after the action name
    std::map<std::string, std::any> data;
    const ParameterValues* parameters{nullptr};
    const ParameterValues* globals{nullptr};
    CancellationToken token;

    // Stops the action from running. Every message is kept; the first one becomes
    // the termination reason.
    void cancel(std::string message) {
        cancelled_ = true;
        if (!message.empty()) messages_.push_back(std::move(message));
    }

    [[nodiscard]] bool isCancelled() const { return cancelled_; }
    [[nodiscard]] const std::vector<std::string>& cancellationMessages() const { return messages_; }
    [[nodiscard]] std::string cancellationMessage() const { return messages_.empty() ? std::string{} : messages_.front(); }

    template <typename T>
    void set(const std::string& key, T value) {
        data[key] = std::move(value);
    }

    template <typename T>
    [[nodiscard]] const T* get(const std::string& key) const {
        const auto it = data.find(key);
        if (it == data.end()) return nullptr;
        return std::any_cast<T>(&it->second);
    }

private:
    bool cancelled_{false};
    std::vector<std::string> messages_;
};

// Handed to action bodies.
struct ActionContext {
    const ParameterValues& params;
    const ParameterValues& globals;
    HookContext& hooks;
    CancellationToken token;
    std::ostream& out;
    std::ostream& err;
};

namespace detail {

template <typename T>
struct IsFuture : std::false_type {};
template <typename T>
struct IsFuture<std::future<T>> : std::true_type {};
template <typename T>
struct IsFuture<std::shared_future<T>> : std::true_type {};

inline ActionResult toActionResult(ActionResult r) { return r; }
inline ActionResult toActionResult(ExitCode c) { return ActionResult::code(c); }
inline ActionResult toActionResult(int c) { return ActionResult::code(c); }

template <typename F>
ActionResult invokeAction(F& fn, ActionContext& ctx) {
    using R = std::invoke_result_t<F&, ActionContext&>;
    if constexpr (IsFuture<R>::value) {
        auto pending = fn(ctx);
        using V = decltype(pending.get());
        if constexpr (std::is_void_v<V>) {
            pending.get();
            return ActionResult{};
        } else {
            return toActionResult(pending.get());
        }
    } else if constexpr (std::is_void_v<R>) {
        fn(ctx);
        return ActionResult{};
    } else {
        return toActionResult(fn(ctx));
    }
}

} // namespace detail

} // namespace cmdtree

#endif // CMDTREE_CONTEXT_HPP
