#ifndef CMDTREE_SRC_TOKENS_HPP
#define CMDTREE_SRC_TOKENS_HPP

#include <optional>
#include <string>
#include <vector>

#include "cmdtree/model.hpp"
#include "cmdtree/utils.hpp"

namespace cmdtree::detail {

enum class TokenKind {
    Positional,
    LongOption,
    ShortOption,
    Terminator, // bare "--"
};

struct Token {
    TokenKind kind{TokenKind::Positional};
    std::string name;                       // without dashes
    std::optional<std::string> inlineValue; // from --name=value
};

inline Token classify(const std::string& raw) {
    Token t;
    if (raw == "--") {
        t.kind = TokenKind::Terminator;
        return t;
    }
    if (raw.size() > 2 && raw[0] == '-' && raw[1] == '-') {
        t.kind = TokenKind::LongOption;
        const auto eq = raw.find('=');
        if (eq == std::string::npos) {
            t.name = raw.substr(2);
        } else {
            t.name = raw.substr(2, eq - 2);
            t.inlineValue = raw.substr(eq + 1);
        }
        return t;
    }
    if (raw.size() == 2 && raw[0] == '-' && raw[1] != '-') {
        t.kind = TokenKind::ShortOption;
        t.name = raw.substr(1);
        return t;
    }
    return t;
}

inline bool isOption(const Token& t) { return t.kind == TokenKind::LongOption || t.kind == TokenKind::ShortOption; }

// Option lookup: long names are case-insensitive, short names are exact.
inline const ParameterSpec* findOption(const std::vector<ParameterSpec>& params, const Token& t) {
    for (const auto& p : params) {
        if (!p.isOption()) continue;
        if (t.kind == TokenKind::LongOption && utils::iequals(p.name(), t.name)) return &p;
        if (t.kind == TokenKind::ShortOption && p.shortName() != 0 && t.name.size() == 1 && p.shortName() == t.name[0]) return &p;
    }
    return nullptr;
}

// True when the option takes the following token as its value.
inline bool consumesNext(const ParameterSpec& p, const Token& t) { return !t.inlineValue && !p.type().isBool(); }

} // namespace cmdtree::detail

#endif // CMDTREE_SRC_TOKENS_HPP
