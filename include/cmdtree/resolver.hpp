#ifndef CMDTREE_RESOLVER_HPP
#define CMDTREE_RESOLVER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "diagnostic.hpp"
#include "model.hpp"

namespace cmdtree {

struct Resolution {
    std::vector<const CommandNode*> path; // root first; always holds at least the root
    const ActionNode* action{nullptr};
    bool actionNamed{false};               // false when the primary action was picked implicitly
    std::vector<std::string> remaining;    // tokens left for the action's parameters
    std::vector<std::string> globalTokens; // global options met while walking the command path

    [[nodiscard]] const CommandNode& command() const { return *path.back(); }
    [[nodiscard]] std::vector<std::string> commandNames() const;
    // "app git" for display.
    [[nodiscard]] std::string commandPath() const;
};

struct ResolveOptions {
    std::size_t commandDistance{3};
    std::size_t actionDistance{2};
    const std::vector<ParameterSpec>* globals{nullptr};
};

// Walks the command tree along the leading tokens and picks the target action. On failure
// `out.path` still holds the deepest command reached.
std::optional<Diagnostic> resolve(const CommandNode& root,
                                  const std::vector<std::string>& tokens,
                                  Resolution& out,
                                  const ResolveOptions& options = {});

// Visible names and aliases, for suggestions.
std::vector<std::string> commandCandidates(const CommandNode& node);
std::vector<std::string> actionCandidates(const CommandNode& node);

} // namespace cmdtree

#endif // CMDTREE_RESOLVER_HPP
