#include "cmdtree/resolver.hpp"

#include "cmdtree/utils.hpp"
#include "tokens.hpp"

namespace cmdtree {

namespace {

template <typename Node>
void addNames(const Node& node, std::vector<std::string>& out) {
    if (node.isHidden()) return;
    out.push_back(node.name());
    out.insert(out.end(), node.aliases().begin(), node.aliases().end());
}

std::vector<std::string> visibleActionNames(const CommandNode& node) {
    std::vector<std::string> names;
    for (const auto& a : node.actions()) {
        if (!a.isHidden()) names.push_back(a.name());
    }
    return names;
}

Diagnostic unknownName(ErrorKind kind,
                       const char* what,
                       const std::string& token,
                       const std::string& path,
                       std::vector<std::string> candidates,
                       std::size_t maxDistance) {
    Diagnostic d;
    d.kind = kind;
    d.message = std::string("unknown ") + what + " \"" + token + "\" for \"" + path + "\"";
    d.found = token;
    d.expected = "a known " + std::string(what);
    d.suggestions = utils::findSimilar(token, candidates, maxDistance);
    return d;
}

bool acceptsPositional(const ActionNode& action) {
    for (const auto& p : action.parameters()) {
        if (!p.isOption()) return true;
    }
    return false;
}

Diagnostic noAction(const Resolution& r) {
    Diagnostic d;
    d.kind = ErrorKind::NoActionSpecified;
    d.message = "no action specified for \"" + r.commandPath() + "\"";
    const auto actions = visibleActionNames(r.command());
    d.expected = actions.empty() ? "a command" : "one of: " + utils::join(actions, ", ");
    return d;
}

} // namespace

std::vector<std::string> Resolution::commandNames() const {
    std::vector<std::string> names;
    names.reserve(path.size());
    for (const auto* node : path) {
        if (!node->name().empty()) names.push_back(node->name());
    }
    return names;
}

std::string Resolution::commandPath() const { return utils::join(commandNames(), " "); }

std::vector<std::string> commandCandidates(const CommandNode& node) {
    std::vector<std::string> out;
    for (const auto& child : node.children()) addNames(child, out);
    return out;
}

std::vector<std::string> actionCandidates(const CommandNode& node) {
    std::vector<std::string> out;
    for (const auto& action : node.actions()) addNames(action, out);
    return out;
}

std::optional<Diagnostic> resolve(const CommandNode& root,
                                  const std::vector<std::string>& tokens,
                                  Resolution& out,
                                  const ResolveOptions& options) {
    out = Resolution{};
    out.path.push_back(&root);

    const std::size_t n = tokens.size();
    std::size_t i = 0;
    while (i < n) {
        const auto t = detail::classify(tokens[i]);
        if (detail::isOption(t)) {
            const auto* global = options.globals ? detail::findOption(*options.globals, t) : nullptr;
            if (!global) break;
            out.globalTokens.push_back(tokens[i]);
            if (detail::consumesNext(*global, t) && i + 1 < n) out.globalTokens.push_back(tokens[++i]);
            ++i;
            continue;
        }
        if (t.kind == detail::TokenKind::Terminator) break;
        const auto* child = out.path.back()->findChild(tokens[i]);
        if (!child) break;
        out.path.push_back(child);
        ++i;
    }

    const CommandNode& cmd = out.command();
    const ActionNode* primary = cmd.primaryAction();

    if (i >= n) {
        if (!primary) return noAction(out);
        out.action = primary;
        return std::nullopt;
    }

    const auto t = detail::classify(tokens[i]);
    if (t.kind == detail::TokenKind::Positional) {
        if (const auto* action = cmd.findAction(tokens[i])) {
            out.action = action;
            out.actionNamed = true;
            out.remaining.assign(tokens.begin() + static_cast<std::ptrdiff_t>(i + 1), tokens.end());
            return std::nullopt;
        }
    }

    // Everything else belongs to the primary action, if there is one. A bare word only goes there
    // when the primary action has a positional to put it in.
    if (primary && (t.kind != detail::TokenKind::Positional || acceptsPositional(*primary))) {
        out.action = primary;
        out.remaining.assign(tokens.begin() + static_cast<std::ptrdiff_t>(i), tokens.end());
        return std::nullopt;
    }
    if (t.kind != detail::TokenKind::Positional) return noAction(out);

    const bool atRoot = out.path.size() == 1;
    if (cmd.actions().empty() || (atRoot && !cmd.children().empty())) {
        auto candidates = commandCandidates(cmd);
        const auto actions = actionCandidates(cmd);
        candidates.insert(candidates.end(), actions.begin(), actions.end());
        return unknownName(ErrorKind::UnknownCommand, "command", tokens[i], out.commandPath(), std::move(candidates),
                           options.commandDistance);
    }

    auto candidates = actionCandidates(cmd);
    const auto children = commandCandidates(cmd);
    candidates.insert(candidates.end(), children.begin(), children.end());
    return unknownName(ErrorKind::UnknownAction, "action", tokens[i], out.commandPath(), std::move(candidates),
                       options.actionDistance);
}

} // namespace cmdtree
