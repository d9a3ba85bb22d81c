#include "cmdtree/validation.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <regex>
#include <system_error>

#include "parse_util.hpp"

namespace cmdtree {

namespace {

bool numericValue(const Value& v, double& out) {
    if (const auto* i = v.as<int>()) {
        out = *i;
    } else if (const auto* i64 = v.as<std::int64_t>()) {
        out = static_cast<double>(*i64);
    } else if (const auto* u32 = v.as<std::uint32_t>()) {
        out = *u32;
    } else if (const auto* u64 = v.as<std::uint64_t>()) {
        out = static_cast<double>(*u64);
    } else if (const auto* f = v.as<float>()) {
        out = *f;
    } else if (const auto* d = v.as<double>()) {
        out = *d;
    } else if (const auto* ms = v.as<std::chrono::milliseconds>()) {
        out = static_cast<double>(ms->count());
    } else {
        return false;
    }
    return true;
}

std::filesystem::path pathOf(const Value& v, const std::string& text) {
    if (const auto* p = v.as<std::filesystem::path>()) return *p;
    return std::filesystem::path(text);
}

class RangeRule final : public ValidationRule {
public:
    RangeRule(double min, double max, std::string message) : ValidationRule(std::move(message)), min_(min), max_(max) {}

    [[nodiscard]] std::string name() const override {
        return "range [" + detail::formatDouble(min_) + ", " + detail::formatDouble(max_) + "]";
    }

protected:
    [[nodiscard]] std::optional<std::string> doCheck(const std::string& parameter, const Value& value, const std::string& text) const override {
        double v = 0.0;
        if (!numericValue(value, v)) return "Value '" + text + "' for '" + parameter + "' is not numeric.";
        if (v >= min_ && v <= max_) return std::nullopt;
        return "Value " + text + " for '" + parameter + "' is outside the allowed range [" + detail::formatDouble(min_) + ", " +
               detail::formatDouble(max_) + "].";
    }

private:
    double min_;
    double max_;
};

class PatternRule final : public ValidationRule {
public:
    PatternRule(const std::string& pattern, std::string message)
        : ValidationRule(std::move(message)), source_(pattern), regex_(pattern) {}

    [[nodiscard]] std::string name() const override { return "pattern '" + source_ + "'"; }

protected:
    [[nodiscard]] std::optional<std::string> doCheck(const std::string& parameter, const Value&, const std::string& text) const override {
        if (std::regex_match(text, regex_)) return std::nullopt;
        return "Value '" + text + "' for '" + parameter + "' does not match the required pattern '" + source_ + "'.";
    }

private:
    std::string source_;
    std::regex regex_;
};

class PathRule final : public ValidationRule {
public:
    PathRule(bool directory, std::string message) : ValidationRule(std::move(message)), directory_(directory) {}

    [[nodiscard]] std::string name() const override { return directory_ ? "directory exists" : "file exists"; }

protected:
    [[nodiscard]] std::optional<std::string> doCheck(const std::string& parameter, const Value& value, const std::string& text) const override {
        const auto path = pathOf(value, text);
        std::error_code ec;
        const bool ok = directory_ ? std::filesystem::is_directory(path, ec) : std::filesystem::is_regular_file(path, ec);
        if (ok) return std::nullopt;
        return std::string(directory_ ? "Directory '" : "File '") + path.string() + "' specified for '" + parameter +
               "' does not exist.";
    }

private:
    bool directory_;
};

class CustomRule final : public ValidationRule {
public:
    CustomRule(std::string name, std::function<bool(const Value&)> predicate, std::string message)
        : ValidationRule(std::move(message)), name_(std::move(name)), predicate_(std::move(predicate)) {}

    [[nodiscard]] std::string name() const override { return name_; }

protected:
    [[nodiscard]] std::optional<std::string> doCheck(const std::string& parameter, const Value& value, const std::string& text) const override {
        if (predicate_ && predicate_(value)) return std::nullopt;
        return "Value '" + text + "' for '" + parameter + "' failed validation '" + name_ + "'.";
    }

private:
    std::string name_;
    std::function<bool(const Value&)> predicate_;
};

} // namespace

std::optional<std::string> ValidationRule::check(const std::string& parameter, const Value& value, const std::string& text) const {
    std::optional<std::string> err;
    try {
        err = doCheck(parameter, value, text);
    } catch (const std::exception& ex) {
        err = "Value '" + text + "' for '" + parameter + "' failed validation '" + name() + "': " + ex.what();
    }
    if (err && !message_.empty()) return message_;
    return err;
}

std::optional<ValidationFailure> applyRules(const std::vector<ValidationRulePtr>& rules,
                                            const std::string& parameter,
                                            const Value& value,
                                            const std::function<std::string(const Value&)>& format) {
    for (const auto& rule : rules) {
        if (!rule) continue;
        if (value.isList()) {
            for (const auto& item : value.items()) {
                if (auto err = rule->check(parameter, item, format(item))) return ValidationFailure{rule->name(), *err};
            }
            continue;
        }
        if (auto err = rule->check(parameter, value, format(value))) return ValidationFailure{rule->name(), *err};
    }
    return std::nullopt;
}

namespace rules {

ValidationRulePtr range(double min, double max, std::string message) {
    return std::make_shared<RangeRule>(min, max, std::move(message));
}

ValidationRulePtr pattern(const std::string& regex, std::string message) {
    return std::make_shared<PatternRule>(regex, std::move(message));
}

ValidationRulePtr fileExists(std::string message) { return std::make_shared<PathRule>(false, std::move(message)); }

ValidationRulePtr directoryExists(std::string message) { return std::make_shared<PathRule>(true, std::move(message)); }

ValidationRulePtr custom(std::string name, std::function<bool(const Value&)> predicate, std::string message) {
    return std::make_shared<CustomRule>(std::move(name), std::move(predicate), std::move(message));
}

} // namespace rules

} // namespace cmdtree
