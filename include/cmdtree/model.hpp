#ifndef CMDTREE_MODEL_HPP
#define CMDTREE_MODEL_HPP

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "context.hpp"
#include "exit_code.hpp"
#include "types.hpp"
#include "validation.hpp"

namespace cmdtree {

enum class ParameterKind {
    Option,
    Argument,
};

class ParameterSpec {
public:
    static ParameterSpec option(std::string name, TypeDescriptor type = TypeDescriptor{}) {
        return ParameterSpec(ParameterKind::Option, std::move(name), std::move(type));
    }
    static ParameterSpec flag(std::string name) { return option(std::move(name), TypeDescriptor::scalar(types::Bool)); }
    static ParameterSpec argument(std::string name, TypeDescriptor type = TypeDescriptor{}) {
        return ParameterSpec(ParameterKind::Argument, std::move(name), std::move(type));
    }

    ParameterSpec& shortName(char c) {
        shortName_ = c;
        return *this;
    }
    ParameterSpec& required(bool v = true) {
        required_ = v;
        return *this;
    }
    ParameterSpec& defaultValue(std::string v) {
        defaultValue_ = std::move(v);
        return *this;
    }
    ParameterSpec& envVar(std::string name) {
        envVar_ = std::move(name);
        return *this;
    }
    // Secure prompts read without echo.
    ParameterSpec& prompt(std::string text, bool secure = false) {
        prompt_ = std::move(text);
        securePrompt_ = secure;
        return *this;
    }
    ParameterSpec& exclusiveGroup(std::string group) {
        exclusiveGroup_ = std::move(group);
        return *this;
    }
    ParameterSpec& addRule(ValidationRulePtr rule) {
        rules_.push_back(std::move(rule));
        return *this;
    }
    ParameterSpec& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }

    [[nodiscard]] ParameterKind kind() const { return kind_; }
    [[nodiscard]] bool isOption() const { return kind_ == ParameterKind::Option; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] char shortName() const { return shortName_; }
    [[nodiscard]] bool isRequired() const { return required_; }
    [[nodiscard]] const std::optional<std::string>& defaultValue() const { return defaultValue_; }
    [[nodiscard]] const std::string& envVar() const { return envVar_; }
    [[nodiscard]] const std::string& prompt() const { return prompt_; }
    [[nodiscard]] bool isSecurePrompt() const { return securePrompt_; }
    [[nodiscard]] const TypeDescriptor& type() const { return type_; }
    [[nodiscard]] const std::string& exclusiveGroup() const { return exclusiveGroup_; }
    [[nodiscard]] const std::vector<ValidationRulePtr>& rules() const { return rules_; }
    [[nodiscard]] const std::string& description() const { return description_; }

    // "--name" for options, "<name>" for arguments.
    [[nodiscard]] std::string displayName() const { return isOption() ? "--" + name_ : "<" + name_ + ">"; }

private:
    ParameterSpec(ParameterKind kind, std::string name, TypeDescriptor type)
        : kind_(kind), name_(std::move(name)), type_(std::move(type)) {}

    ParameterKind kind_;
    std::string name_;
    char shortName_{0};
    bool required_{false};
    std::optional<std::string> defaultValue_;
    std::string envVar_;
    std::string prompt_;
    bool securePrompt_{false};
    TypeDescriptor type_;
    std::string exclusiveGroup_;
    std::vector<ValidationRulePtr> rules_;
    std::string description_;
};

enum class HookPhase {
    Before,
    After,
    OnError,
};

using BeforeHook = std::function<void(HookContext&)>;
using AfterHook = std::function<void(HookContext&, const ActionResult&)>;
// Returns true when the exception was handled.
using ErrorHook = std::function<bool(HookContext&, const std::exception&)>;

// Hook bodies may return std::future<...>; the orchestrator waits on it before moving on.
struct HookSpec {
    HookPhase phase{HookPhase::Before};
    std::string handlerId;
    int order{0};
    BeforeHook before;
    AfterHook after;
    ErrorHook onError;

    template <typename F>
    static HookSpec makeBefore(std::string id, F fn, int order = 0) {
        HookSpec h{HookPhase::Before, std::move(id), order, {}, {}, {}};
        h.before = [fn = std::move(fn)](HookContext& ctx) mutable {
            if constexpr (detail::IsFuture<std::invoke_result_t<F&, HookContext&>>::value) {
                fn(ctx).get();
            } else {
                fn(ctx);
            }
        };
        return h;
    }

    template <typename F>
    static HookSpec makeAfter(std::string id, F fn, int order = 0) {
        HookSpec h{HookPhase::After, std::move(id), order, {}, {}, {}};
        h.after = [fn = std::move(fn)](HookContext& ctx, const ActionResult& result) mutable {
            if constexpr (detail::IsFuture<std::invoke_result_t<F&, HookContext&, const ActionResult&>>::value) {
                fn(ctx, result).get();
            } else {
                fn(ctx, result);
            }
        };
        return h;
    }

    template <typename F>
    static HookSpec makeOnError(std::string id, F fn, int order = 0) {
        HookSpec h{HookPhase::OnError, std::move(id), order, {}, {}, {}};
        h.onError = [fn = std::move(fn)](HookContext& ctx, const std::exception& ex) mutable -> bool {
            if constexpr (detail::IsFuture<std::invoke_result_t<F&, HookContext&, const std::exception&>>::value) {
                return static_cast<bool>(fn(ctx, ex).get());
            } else {
                return static_cast<bool>(fn(ctx, ex));
            }
        };
        return h;
    }
};

// Maps an exception type (and everything derived from it) to an exit code.
class ExitCodeMapping {
public:
    template <typename E>
    static ExitCodeMapping of(int exitCode, std::string kind = {}) {
        static_assert(std::is_base_of_v<std::exception, E>, "exit code mappings need a std::exception type");
        ExitCodeMapping m;
        m.exitCode_ = exitCode;
        m.kind_ = kind.empty() ? typeid(E).name() : std::move(kind);
        m.type_ = &typeid(E);
        m.matches_ = [](const std::exception& ex) { return dynamic_cast<const E*>(&ex) != nullptr; };
        m.raise_ = [] { throw static_cast<const E*>(nullptr); };
        m.catches_ = [](const std::function<void()>& raise) {
            try {
                raise();
            } catch (const E*) {
                return true;
            } catch (const std::exception*) {
                return false;
            }
            return false;
        };
        return m;
    }

    template <typename E>
    static ExitCodeMapping of(ExitCode exitCode, std::string kind = {}) {
        return of<E>(toInt(exitCode), std::move(kind));
    }

    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] const std::string& kind() const { return kind_; }
    [[nodiscard]] const std::type_info& type() const { return *type_; }

    [[nodiscard]] bool matches(const std::exception& ex) const { return matches_ && matches_(ex); }

    // True when this mapping's exception type is a strict subclass of `other`'s.
    [[nodiscard]] bool isMoreDerivedThan(const ExitCodeMapping& other) const {
        if (*type_ == *other.type_) return false;
        return other.catches_(raise_);
    }

private:
    ExitCodeMapping() = default;

    int exitCode_{toInt(ExitCode::Error)};
    std::string kind_;
    const std::type_info* type_{&typeid(std::exception)};
    std::function<bool(const std::exception&)> matches_;
    std::function<void()> raise_;
    std::function<bool(const std::function<void()>&)> catches_;
};

class ActionNode {
public:
    using Handler = std::function<ActionResult(ActionContext&)>;

    explicit ActionNode(std::string name, std::string description = {})
        : name_(std::move(name)), description_(std::move(description)) {}

    ActionNode& aliases(std::vector<std::string> a) {
        aliases_ = std::move(a);
        return *this;
    }
    ActionNode& addAlias(std::string a) {
        aliases_.push_back(std::move(a));
        return *this;
    }
    ActionNode& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }
    ActionNode& hidden(bool v = true) {
        hidden_ = v;
        return *this;
    }
    ActionNode& primary(bool v = true) {
        primary_ = v;
        return *this;
    }
    ActionNode& addParameter(ParameterSpec p) {
        parameters_.push_back(std::move(p));
        return *this;
    }
    ActionNode& addHook(HookSpec h) {
        hooks_.push_back(std::move(h));
        return *this;
    }
    template <typename F>
    ActionNode& before(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeBefore(std::move(id), std::move(fn), order));
    }
    template <typename F>
    ActionNode& after(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeAfter(std::move(id), std::move(fn), order));
    }
    template <typename F>
    ActionNode& onError(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeOnError(std::move(id), std::move(fn), order));
    }
    ActionNode& addExitCode(ExitCodeMapping m) {
        exitCodes_.push_back(std::move(m));
        return *this;
    }
    template <typename E>
    ActionNode& mapException(int code) {
        return addExitCode(ExitCodeMapping::of<E>(code));
    }
    template <typename E>
    ActionNode& mapException(ExitCode code) {
        return addExitCode(ExitCodeMapping::of<E>(code));
    }

    // The body may return void, int, ExitCode, ActionResult, or a std::future of any of them.
    template <typename F>
    ActionNode& action(F fn) {
        handler_ = [fn = std::move(fn)](ActionContext& ctx) mutable { return detail::invokeAction(fn, ctx); };
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] bool isHidden() const { return hidden_; }
    [[nodiscard]] bool isPrimary() const { return primary_; }
    [[nodiscard]] const std::vector<ParameterSpec>& parameters() const { return parameters_; }
    [[nodiscard]] const std::vector<HookSpec>& hooks() const { return hooks_; }
    [[nodiscard]] const std::vector<ExitCodeMapping>& exitCodes() const { return exitCodes_; }
    [[nodiscard]] const Handler& handler() const { return handler_; }

    // Case-insensitive match against the name and every alias.
    [[nodiscard]] bool matches(std::string_view token) const;

private:
    std::string name_;
    std::vector<std::string> aliases_;
    std::string description_;
    bool hidden_{false};
    bool primary_{false};
    std::vector<ParameterSpec> parameters_;
    std::vector<HookSpec> hooks_;
    std::vector<ExitCodeMapping> exitCodes_;
    Handler handler_;
};

class CommandNode {
public:
    explicit CommandNode(std::string name, std::string description = {})
        : name_(std::move(name)), description_(std::move(description)) {}

    CommandNode& aliases(std::vector<std::string> a) {
        aliases_ = std::move(a);
        return *this;
    }
    CommandNode& addAlias(std::string a) {
        aliases_.push_back(std::move(a));
        return *this;
    }
    CommandNode& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }
    CommandNode& hidden(bool v = true) {
        hidden_ = v;
        return *this;
    }
    CommandNode& addCommand(CommandNode child) {
        children_.push_back(std::move(child));
        return *this;
    }
    CommandNode& addAction(ActionNode action) {
        actions_.push_back(std::move(action));
        return *this;
    }
    CommandNode& addHook(HookSpec h) {
        hooks_.push_back(std::move(h));
        return *this;
    }
    template <typename F>
    CommandNode& before(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeBefore(std::move(id), std::move(fn), order));
    }
    template <typename F>
    CommandNode& after(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeAfter(std::move(id), std::move(fn), order));
    }
    template <typename F>
    CommandNode& onError(std::string id, F fn, int order = 0) {
        return addHook(HookSpec::makeOnError(std::move(id), std::move(fn), order));
    }
    CommandNode& addExitCode(ExitCodeMapping m) {
        exitCodes_.push_back(std::move(m));
        return *this;
    }
    template <typename E>
    CommandNode& mapException(int code) {
        return addExitCode(ExitCodeMapping::of<E>(code));
    }
    template <typename E>
    CommandNode& mapException(ExitCode code) {
        return addExitCode(ExitCodeMapping::of<E>(code));
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] bool isHidden() const { return hidden_; }
    [[nodiscard]] const std::vector<CommandNode>& children() const { return children_; }
    [[nodiscard]] const std::vector<ActionNode>& actions() const { return actions_; }
    [[nodiscard]] const std::vector<HookSpec>& hooks() const { return hooks_; }
    [[nodiscard]] const std::vector<ExitCodeMapping>& exitCodes() const { return exitCodes_; }

    [[nodiscard]] bool matches(std::string_view token) const;
    [[nodiscard]] const CommandNode* findChild(std::string_view token) const;
    [[nodiscard]] const ActionNode* findAction(std::string_view token) const;
    [[nodiscard]] const ActionNode* primaryAction() const;

private:
    std::string name_;
    std::vector<std::string> aliases_;
    std::string description_;
    bool hidden_{false};
    std::vector<CommandNode> children_;
    std::vector<ActionNode> actions_;
    std::vector<HookSpec> hooks_;
    std::vector<ExitCodeMapping> exitCodes_;
};

// Checks the structural invariants of a command tree: sibling names and aliases are unique
// (case-insensitively), aliases are unique across the tree, at most one primary action per
// command, parameter names are unique per action, a collection argument is the last argument,
// required parameters carry no default, and every parameter type has a registered converter.
// Returns an error message for the first violation.
std::optional<std::string> validateModel(const CommandNode& root,
                                         const ConversionRegistry& converters,
                                         const std::vector<ParameterSpec>& globals = {});

} // namespace cmdtree

#endif // CMDTREE_MODEL_HPP
