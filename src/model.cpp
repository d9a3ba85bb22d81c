#include "cmdtree/model.hpp"

#include <set>

#include "cmdtree/utils.hpp"

namespace cmdtree {

namespace {

template <typename Node>
bool matchesNode(const Node& node, std::string_view token) {
    if (utils::iequals(node.name(), token)) return true;
    for (const auto& alias : node.aliases()) {
        if (utils::iequals(alias, token)) return true;
    }
    return false;
}

// Adds the lowercase name and aliases of `node` to `seen`; returns the first clash.
template <typename Node>
std::optional<std::string> claimNames(const Node& node, std::set<std::string>& seen) {
    if (!seen.insert(utils::toLower(node.name())).second) return node.name();
    for (const auto& alias : node.aliases()) {
        if (!seen.insert(utils::toLower(alias)).second) return alias;
    }
    return std::nullopt;
}

std::optional<std::string> checkExitCodes(const std::vector<ExitCodeMapping>& mappings, const std::string& owner) {
    for (std::size_t i = 0; i < mappings.size(); ++i) {
        for (std::size_t j = i + 1; j < mappings.size(); ++j) {
            if (mappings[i].type() == mappings[j].type()) {
                return "'" + owner + "' maps exception '" + mappings[i].kind() + "' more than once";
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkParameters(const std::vector<ParameterSpec>& params,
                                           const std::string& owner,
                                           const ConversionRegistry& converters) {
    std::set<std::string> names;
    std::set<char> shorts;
    bool collectionArgumentSeen = false;
    for (const auto& p : params) {
        if (p.name().empty()) return "'" + owner + "' declares a parameter without a name";
        if (!names.insert(utils::toLower(p.name())).second) {
            return "'" + owner + "' declares parameter '" + p.name() + "' more than once";
        }
        if (p.shortName() != 0 && !shorts.insert(p.shortName()).second) {
            return "'" + owner + "' declares short name '-" + std::string(1, p.shortName()) + "' more than once";
        }
        if (p.isRequired() && p.defaultValue()) {
            return "parameter '" + p.name() + "' of '" + owner + "' is required and has a default value";
        }
        if (!converters.contains(p.type().type)) {
            return "parameter '" + p.name() + "' of '" + owner + "' has unknown type '" + p.type().type + "'";
        }
        if (p.kind() == ParameterKind::Argument) {
            if (collectionArgumentSeen) {
                return "'" + owner + "' declares argument '" + p.name() + "' after a collection argument";
            }
            if (p.type().collection) collectionArgumentSeen = true;
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkCommand(const CommandNode& cmd,
                                        const std::string& path,
                                        const ConversionRegistry& converters,
                                        std::set<std::string>& treeAliases) {
    if (cmd.name().empty() && !path.empty()) return "command under '" + path + "' has no name";
    const std::string here = path.empty() ? cmd.name() : path + " " + cmd.name();

    for (const auto& alias : cmd.aliases()) {
        if (!treeAliases.insert(utils::toLower(alias)).second) return "alias '" + alias + "' is used more than once";
    }
    if (auto err = checkExitCodes(cmd.exitCodes(), here)) return err;

    std::set<std::string> childNames;
    for (const auto& child : cmd.children()) {
        if (auto clash = claimNames(child, childNames)) {
            return "command '" + here + "' has more than one child named '" + *clash + "'";
        }
    }

    std::set<std::string> actionNames;
    const ActionNode* primary = nullptr;
    for (const auto& action : cmd.actions()) {
        if (action.name().empty()) return "command '" + here + "' has an action without a name";
        if (auto clash = claimNames(action, actionNames)) {
            return "command '" + here + "' has more than one action named '" + *clash + "'";
        }
        if (action.isPrimary()) {
            if (primary) {
                return "command '" + here + "' has more than one primary action ('" + primary->name() + "', '" + action.name() + "')";
            }
            primary = &action;
        }
        const std::string owner = here.empty() ? action.name() : here + " " + action.name();
        if (auto err = checkParameters(action.parameters(), owner, converters)) return err;
        if (auto err = checkExitCodes(action.exitCodes(), owner)) return err;
    }

    for (const auto& child : cmd.children()) {
        if (auto err = checkCommand(child, here, converters, treeAliases)) return err;
    }
    return std::nullopt;
}

} // namespace

bool ActionNode::matches(std::string_view token) const { return matchesNode(*this, token); }

bool CommandNode::matches(std::string_view token) const { return matchesNode(*this, token); }

const CommandNode* CommandNode::findChild(std::string_view token) const {
    for (const auto& child : children_) {
        if (child.matches(token)) return &child;
    }
    return nullptr;
}

const ActionNode* CommandNode::findAction(std::string_view token) const {
    for (const auto& action : actions_) {
        if (action.matches(token)) return &action;
    }
    return nullptr;
}

const ActionNode* CommandNode::primaryAction() const {
    for (const auto& action : actions_) {
        if (action.isPrimary()) return &action;
    }
    return nullptr;
}

std::optional<std::string> validateModel(const CommandNode& root,
                                         const ConversionRegistry& converters,
                                         const std::vector<ParameterSpec>& globals) {
    for (const auto& g : globals) {
        if (!g.isOption()) return "global parameter '" + g.name() + "' must be an option";
    }
    if (auto err = checkParameters(globals, "global options", converters)) return err;

    std::set<std::string> treeAliases;
    return checkCommand(root, "", converters, treeAliases);
}

} // namespace cmdtree
