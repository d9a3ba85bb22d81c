#ifndef CMDTREE_HELP_HPP
#define CMDTREE_HELP_HPP

#include <ostream>
#include <string>
#include <vector>

#include "model.hpp"
#include "types.hpp"

namespace cmdtree {

// Renders help text for a command or an action. Hidden nodes are left out of listings.
class HelpRenderer {
public:
    HelpRenderer(const ConversionRegistry& converters, const std::vector<ParameterSpec>& globals)
        : converters_(&converters), globals_(&globals) {}

    void printCommandHelp(std::ostream& os, const std::vector<const CommandNode*>& path) const;
    void printActionHelp(std::ostream& os, const std::vector<const CommandNode*>& path, const ActionNode& action) const;

    [[nodiscard]] std::string usageLine(const std::vector<const CommandNode*>& path, const ActionNode* action) const;
    [[nodiscard]] std::string formatParameter(const ParameterSpec& p) const;

private:
    void printGlobals(std::ostream& os) const;

    const ConversionRegistry* converters_;
    const std::vector<ParameterSpec>* globals_;
};

// "app git commit"
std::string joinPath(const std::vector<const CommandNode*>& path, const ActionNode* action = nullptr);

} // namespace cmdtree

#endif // CMDTREE_HELP_HPP
