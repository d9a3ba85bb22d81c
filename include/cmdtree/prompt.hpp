#ifndef CMDTREE_PROMPT_HPP
#define CMDTREE_PROMPT_HPP

#include <iosfwd>
#include <optional>
#include <string>

namespace cmdtree {

// Supplies values for parameters that declare a prompt.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Empty optional when no value could be read (EOF, closed input).
    virtual std::optional<std::string> ask(const std::string& text, bool secure) = 0;
};

// Writes the prompt to `out` and reads one line from `in`. Secure prompts turn off terminal
// echo while reading when `in` is attached to a terminal.
class TerminalPrompter final : public Prompter {
public:
    TerminalPrompter();
    TerminalPrompter(std::istream& in, std::ostream& out);

    std::optional<std::string> ask(const std::string& text, bool secure) override;

private:
    std::istream* in_;
    std::ostream* out_;
};

// True when standard input is attached to a terminal.
bool isInteractive();

} // namespace cmdtree

#endif // CMDTREE_PROMPT_HPP
