#ifndef CMDTREE_VALIDATION_HPP
#define CMDTREE_VALIDATION_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "value.hpp"

namespace cmdtree {

// A declarative constraint applied to a converted value.
class ValidationRule {
public:
    explicit ValidationRule(std::string message = {}) : message_(std::move(message)) {}
    virtual ~ValidationRule() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // `text` is the formatted form of `value`. Returns an error message when the rule fails;
    // a custom message, when set, replaces the rule's own.
    [[nodiscard]] std::optional<std::string> check(const std::string& parameter, const Value& value, const std::string& text) const;

protected:
    [[nodiscard]] virtual std::optional<std::string> doCheck(const std::string& parameter,
                                                             const Value& value,
                                                             const std::string& text) const = 0;

private:
    std::string message_;
};

using ValidationRulePtr = std::shared_ptr<const ValidationRule>;

struct ValidationFailure {
    std::string rule;
    std::string message;
};

// Runs `rules` in order against `value` (element-wise for lists) and stops at the first failure.
// `format` renders one element for messages.
std::optional<ValidationFailure> applyRules(const std::vector<ValidationRulePtr>& rules,
                                            const std::string& parameter,
                                            const Value& value,
                                            const std::function<std::string(const Value&)>& format);

namespace rules {

// Inclusive numeric range. Accepts any arithmetic value and durations (in milliseconds).
ValidationRulePtr range(double min, double max, std::string message = {});

// The formatted value must match `regex` in full. Throws std::regex_error on a bad pattern.
ValidationRulePtr pattern(const std::string& regex, std::string message = {});

ValidationRulePtr fileExists(std::string message = {});
ValidationRulePtr directoryExists(std::string message = {});

ValidationRulePtr custom(std::string name, std::function<bool(const Value&)> predicate, std::string message = {});

} // namespace rules

} // namespace cmdtree

#endif // CMDTREE_VALIDATION_HPP
