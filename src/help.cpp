#include "cmdtree/help.hpp"

#include <algorithm>
#include <sstream>

#include "cmdtree/utils.hpp"

namespace cmdtree {

namespace {

std::string withAliases(const std::string& name, const std::vector<std::string>& aliases) {
    if (aliases.empty()) return name;
    return name + ", " + utils::join(aliases, ", ");
}

std::string argumentUsage(const ParameterSpec& p) {
    std::string s = "<" + p.name() + ">";
    if (p.type().collection) s += "...";
    if (!p.isRequired()) s = "[" + s + "]";
    return s;
}

} // namespace

std::string joinPath(const std::vector<const CommandNode*>& path, const ActionNode* action) {
    std::vector<std::string> names;
    for (const auto* node : path) {
        if (!node->name().empty()) names.push_back(node->name());
    }
    if (action) names.push_back(action->name());
    return utils::join(names, " ");
}

std::string HelpRenderer::usageLine(const std::vector<const CommandNode*>& path, const ActionNode* action) const {
    std::ostringstream oss;
    oss << "Usage: " << joinPath(path, action);
    if (!action) {
        const auto& cmd = *path.back();
        if (!cmd.children().empty()) oss << " [command]";
        if (!cmd.actions().empty()) oss << (cmd.primaryAction() ? " [action]" : " <action>");
        oss << " [options]\n";
        return oss.str();
    }

    oss << " [options]";
    for (const auto& p : action->parameters()) {
        if (!p.isOption()) oss << " " << argumentUsage(p);
    }
    oss << "\n";
    return oss.str();
}

std::string HelpRenderer::formatParameter(const ParameterSpec& p) const {
    std::string names;
    if (p.isOption()) {
        if (p.shortName() != 0) names += std::string("-") + p.shortName() + ", ";
        names += "--" + p.name();
        if (!p.type().isBool()) names += " " + converters_->describe(p.type());
    } else {
        names += "<" + p.name() + "> " + converters_->describe(p.type());
    }

    std::string desc = p.description();
    const auto append = [&desc](const std::string& part) {
        if (!desc.empty()) desc.push_back(' ');
        desc += part;
    };
    if (p.isRequired()) append("(required)");
    if (p.defaultValue() && !p.defaultValue()->empty()) append("(default: " + *p.defaultValue() + ")");
    if (!p.envVar().empty()) append("(env: " + p.envVar() + ")");

    if (!desc.empty()) names += " - " + desc;
    return names;
}

void HelpRenderer::printCommandHelp(std::ostream& os, const std::vector<const CommandNode*>& path) const {
    const auto& cmd = *path.back();
    os << usageLine(path, nullptr);
    if (!cmd.description().empty()) os << "\n" << cmd.description() << "\n";

    std::vector<const CommandNode*> children;
    for (const auto& c : cmd.children()) {
        if (!c.isHidden()) children.push_back(&c);
    }
    std::sort(children.begin(), children.end(), [](const CommandNode* a, const CommandNode* b) { return a->name() < b->name(); });
    if (!children.empty()) {
        os << "\nCommands:\n";
        for (const auto* c : children) os << "  " << withAliases(c->name(), c->aliases()) << " - " << c->description() << "\n";
    }

    std::vector<const ActionNode*> actions;
    for (const auto& a : cmd.actions()) {
        if (!a.isHidden()) actions.push_back(&a);
    }
    if (!actions.empty()) {
        os << "\nActions:\n";
        for (const auto* a : actions) {
            os << "  " << withAliases(a->name(), a->aliases()) << " - " << a->description();
            if (a->isPrimary()) os << " (default)";
            os << "\n";
        }
    }

    os << "\nOptions:\n";
    os << "  -h, --help - Help for " << (cmd.name().empty() ? std::string("this command") : cmd.name()) << "\n";
    printGlobals(os);
}

void HelpRenderer::printActionHelp(std::ostream& os, const std::vector<const CommandNode*>& path, const ActionNode& action) const {
    os << usageLine(path, &action);
    if (!action.description().empty()) os << "\n" << action.description() << "\n";
    if (!action.aliases().empty()) os << "\nAliases: " << utils::join(action.aliases(), ", ") << "\n";

    std::vector<const ParameterSpec*> arguments;
    std::vector<const ParameterSpec*> options;
    for (const auto& p : action.parameters()) (p.isOption() ? options : arguments).push_back(&p);

    if (!arguments.empty()) {
        os << "\nArguments:\n";
        for (const auto* p : arguments) os << "  " << formatParameter(*p) << "\n";
    }

    os << "\nOptions:\n";
    for (const auto* p : options) os << "  " << formatParameter(*p) << "\n";
    os << "  -h, --help - Help for " << action.name() << "\n";
    printGlobals(os);
}

void HelpRenderer::printGlobals(std::ostream& os) const {
    if (globals_->empty()) return;
    os << "\nGlobal Options:\n";
    for (const auto& p : *globals_) os << "  " << formatParameter(p) << "\n";
}

} // namespace cmdtree
