#ifndef CMDTREE_BINDER_HPP
#define CMDTREE_BINDER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "diagnostic.hpp"
#include "model.hpp"
#include "prompt.hpp"
#include "types.hpp"
#include "value.hpp"

namespace cmdtree {

// Returns the value of an environment variable, or empty when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment through std::getenv.
std::optional<std::string> processEnvironment(const std::string& name);

struct BindOptions {
    const ConversionRegistry* converters{nullptr};
    EnvironmentLookup environment;
    Prompter* prompter{nullptr};
    bool interactive{false};
    std::size_t optionDistance{2};
    // Options not declared by the action but named here are routed to `globalTokens`.
    const std::vector<ParameterSpec>* globals{nullptr};
};

// Matches tokens against `params` and resolves every parameter with precedence
// command line > environment > prompt > default, then converts, validates, and
// checks mutually exclusive groups.
class Binder {
public:
    explicit Binder(BindOptions options);

    std::optional<Diagnostic> bind(const std::vector<ParameterSpec>& params,
                                   const std::vector<std::string>& tokens,
                                   ParameterValues& out,
                                   std::vector<std::string>* globalTokens = nullptr) const;

private:
    struct Collected {
        std::vector<std::vector<std::string>> raw; // per parameter, in order of appearance
    };

    std::optional<Diagnostic> collect(const std::vector<ParameterSpec>& params,
                                      const std::vector<std::string>& tokens,
                                      Collected& collected,
                                      std::vector<std::string>* globalTokens) const;

    std::optional<Diagnostic> resolveOne(const ParameterSpec& p,
                                         std::size_t position,
                                         std::vector<std::string> raw,
                                         ParameterValues& out) const;

    std::optional<Diagnostic> checkExclusive(const std::vector<ParameterSpec>& params, const ParameterValues& values) const;

    BindOptions options_;
};

} // namespace cmdtree

#endif // CMDTREE_BINDER_HPP
