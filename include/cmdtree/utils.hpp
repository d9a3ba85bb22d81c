#ifndef CMDTREE_UTILS_HPP
#define CMDTREE_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdtree::utils {

inline std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const auto ch : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

inline std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Splits on `sep`, trimming whitespace around each part and dropping empty parts.
inline std::vector<std::string> splitTrimmed(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::size_t start = 0;
    for (;;) {
        const auto pos = s.find(sep, start);
        const auto part = trimWs(pos == std::string_view::npos ? s.substr(start) : s.substr(start, pos - start));
        if (!part.empty()) out.emplace_back(part);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

// Case-insensitive "did you mean" ranking: candidates within `maxDistance`, ordered by
// distance then lexically, at most `maxResults` entries.
inline std::vector<std::string> findSimilar(std::string_view input,
                                            const std::vector<std::string>& candidates,
                                            std::size_t maxDistance = 2,
                                            std::size_t maxResults = 3) {
    struct Scored {
        std::string value;
        std::size_t score;
    };

    if (input.empty() || candidates.empty()) return {};

    const auto needle = toLower(input);
    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        if (std::any_of(scored.begin(), scored.end(), [&](const Scored& s) { return s.value == c; })) continue;
        const auto d = levenshteinDistance(needle, toLower(c));
        if (d <= maxDistance) scored.push_back({c, d});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.value < b.value;
    });

    std::vector<std::string> out;
    out.reserve(std::min(maxResults, scored.size()));
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        out.push_back(s.value);
    }
    return out;
}

inline std::string findMostSimilar(std::string_view input, const std::vector<std::string>& candidates, std::size_t maxDistance = 3) {
    const auto all = findSimilar(input, candidates, maxDistance, 1);
    return all.empty() ? std::string{} : all.front();
}

} // namespace cmdtree::utils

#endif // CMDTREE_UTILS_HPP
