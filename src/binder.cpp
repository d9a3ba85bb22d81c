#include "cmdtree/binder.hpp"

#include <cctype>
#include <cstdlib>
#include <map>
#include <stdexcept>

#include "cmdtree/utils.hpp"
#include "cmdtree/validation.hpp"
#include "tokens.hpp"

namespace cmdtree {

namespace {

std::string quoted(const std::string& s) { return "\"" + s + "\""; }

bool isSet(const ParameterSpec& p, const ParameterValues::Entry& e) {
    if (e.source == ValueSource::Default) return false;
    if (p.type().isBool()) {
        const auto* b = e.value.as<bool>();
        return b && *b;
    }
    return true;
}

std::vector<std::string> optionCandidates(const std::vector<ParameterSpec>& params, const std::vector<ParameterSpec>* globals) {
    std::vector<std::string> out;
    const auto add = [&out](const std::vector<ParameterSpec>& from) {
        for (const auto& p : from) {
            if (p.isOption()) out.push_back("--" + p.name());
        }
    };
    add(params);
    if (globals) add(*globals);
    return out;
}

} // namespace

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

Binder::Binder(BindOptions options) : options_(std::move(options)) {
    if (!options_.converters) throw std::invalid_argument("Binder requires a conversion registry");
}

std::optional<Diagnostic> Binder::bind(const std::vector<ParameterSpec>& params,
                                       const std::vector<std::string>& tokens,
                                       ParameterValues& out,
                                       std::vector<std::string>* globalTokens) const {
    Collected collected;
    if (auto err = collect(params, tokens, collected, globalTokens)) return err;

    ParameterValues values;
    std::size_t position = 0;
    for (std::size_t i = 0; i < params.size(); ++i) {
        const auto& p = params[i];
        if (!p.isOption()) ++position;
        if (auto err = resolveOne(p, position, std::move(collected.raw[i]), values)) return err;
    }

    if (auto err = checkExclusive(params, values)) return err;
    out = std::move(values);
    return std::nullopt;
}

std::optional<Diagnostic> Binder::collect(const std::vector<ParameterSpec>& params,
                                          const std::vector<std::string>& tokens,
                                          Collected& collected,
                                          std::vector<std::string>* globalTokens) const {
    collected.raw.assign(params.size(), {});

    std::vector<std::size_t> positional;
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (!params[i].isOption()) positional.push_back(i);
    }
    const auto indexOf = [&params](const ParameterSpec* p) { return static_cast<std::size_t>(p - params.data()); };

    std::size_t nextPositional = 0;
    bool positionalOnly = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& raw = tokens[i];
        auto t = positionalOnly ? detail::Token{} : detail::classify(raw);

        if (t.kind == detail::TokenKind::Terminator) {
            positionalOnly = true;
            continue;
        }

        if (detail::isOption(t)) {
            if (const auto* p = detail::findOption(params, t)) {
                auto& slot = collected.raw[indexOf(p)];
                if (t.inlineValue) {
                    slot.push_back(*t.inlineValue);
                } else if (p->type().isBool()) {
                    slot.emplace_back("true");
                } else if (i + 1 < tokens.size()) {
                    slot.push_back(tokens[++i]);
                } else {
                    Diagnostic d;
                    d.kind = ErrorKind::ConversionFailure;
                    d.message = "option " + p->displayName() + " requires a value";
                    d.expected = options_.converters->describe(p->type());
                    return d;
                }
                continue;
            }

            const auto* global = options_.globals ? detail::findOption(*options_.globals, t) : nullptr;
            if (global && globalTokens) {
                globalTokens->push_back(raw);
                if (detail::consumesNext(*global, t) && i + 1 < tokens.size()) globalTokens->push_back(tokens[++i]);
                continue;
            }

            // "-5" is a number unless some parameter claims the short name.
            const bool digitShort = t.kind == detail::TokenKind::ShortOption && std::isdigit(static_cast<unsigned char>(t.name[0]));
            if (!digitShort) {
                Diagnostic d;
                d.kind = ErrorKind::UnknownOption;
                d.message = "unknown option: " + raw;
                d.found = raw;
                if (t.kind == detail::TokenKind::LongOption) {
                    d.suggestions = utils::findSimilar("--" + t.name, optionCandidates(params, options_.globals), options_.optionDistance);
                }
                return d;
            }
        }

        if (nextPositional >= positional.size()) {
            Diagnostic d;
            d.kind = ErrorKind::UnexpectedArgument;
            d.message = "unexpected argument " + quoted(raw);
            d.found = raw;
            return d;
        }
        const auto idx = positional[nextPositional];
        collected.raw[idx].push_back(raw);
        // A collection argument is last and takes every remaining positional token.
        if (!params[idx].type().collection) ++nextPositional;
    }
    return std::nullopt;
}

std::optional<Diagnostic> Binder::resolveOne(const ParameterSpec& p,
                                             std::size_t position,
                                             std::vector<std::string> raw,
                                             ParameterValues& out) const {
    const auto& registry = *options_.converters;
    ValueSource source = ValueSource::CommandLine;

    if (raw.empty() && !p.envVar().empty() && options_.environment) {
        if (auto env = options_.environment(p.envVar())) {
            raw.push_back(std::move(*env));
            source = ValueSource::Environment;
        }
    }
    if (raw.empty() && !p.prompt().empty() && options_.interactive && options_.prompter) {
        auto answer = options_.prompter->ask(p.prompt(), p.isSecurePrompt());
        if (answer && !answer->empty()) {
            raw.push_back(std::move(*answer));
            source = ValueSource::Prompt;
        }
    }
    if (raw.empty() && p.defaultValue()) {
        raw.push_back(*p.defaultValue());
        source = ValueSource::Default;
    }

    if (raw.empty()) {
        if (p.type().isBool() && p.isOption()) {
            out.set(p.name(), Value::of(false), ValueSource::Default);
            return std::nullopt;
        }
        if (!p.isRequired()) return std::nullopt;

        Diagnostic d;
        d.kind = ErrorKind::MissingRequiredParameter;
        if (p.isOption()) {
            d.message = "required option not set: " + p.displayName();
            d.expected = p.displayName() + " <" + registry.describe(p.type()) + ">";
        } else {
            d.message = "required argument not set: " + p.displayName() + " (position " + std::to_string(position) + ")";
            d.expected = "positional argument " + std::to_string(position);
        }
        return d;
    }

    Value value;
    if (auto reason = registry.convert(p.type(), raw, value)) {
        const std::string offending = p.type().collection ? utils::join(raw, ",") : raw.back();
        Diagnostic d;
        d.kind = ErrorKind::ConversionFailure;
        d.expected = registry.describe(p.type());
        d.found = offending;
        d.message = "invalid value " + quoted(offending) + " for " + p.displayName() + ": " + *reason;
        return d;
    }

    if (source != ValueSource::Default) {
        const auto format = [&registry, &p](const Value& v) { return registry.format(TypeDescriptor::scalar(p.type().type), v); };
        if (auto failure = applyRules(p.rules(), p.name(), value, format)) {
            Diagnostic d;
            d.kind = ErrorKind::ValidationFailure;
            d.message = failure->message;
            d.expected = failure->rule;
            d.found = p.type().collection ? utils::join(raw, ",") : raw.back();
            return d;
        }
    }

    out.set(p.name(), std::move(value), source, std::move(raw));
    return std::nullopt;
}

std::optional<Diagnostic> Binder::checkExclusive(const std::vector<ParameterSpec>& params, const ParameterValues& values) const {
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& p : params) {
        if (p.exclusiveGroup().empty()) continue;
        if (groups.find(p.exclusiveGroup()) == groups.end()) order.push_back(p.exclusiveGroup());
        auto& members = groups[p.exclusiveGroup()];
        const auto* entry = values.find(p.name());
        if (entry && isSet(p, *entry)) members.push_back("'" + p.displayName() + "'");
    }

    for (const auto& group : order) {
        const auto& members = groups[group];
        if (members.size() < 2) continue;
        Diagnostic d;
        d.kind = ErrorKind::MutualExclusionConflict;
        d.message = "options are mutually exclusive: " + utils::join(members, ", ");
        d.expected = "at most one option of group '" + group + "'";
        d.found = utils::join(members, ", ");
        return d;
    }
    return std::nullopt;
}

} // namespace cmdtree
