#ifndef PARG_UTILS_HPP
#define PARG_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parg::utils {

inline bool equalsNoCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

// Levenshtein distance, one row at a time.
inline std::size_t editDistance(std::string_view from, std::string_view to) {
    if (from.empty()) return to.size();
    if (to.empty()) return from.size();

    std::vector<std::size_t> row(to.size() + 1);
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = j;

    for (std::size_t i = 1; i <= from.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= to.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t substitution = diagonal + (from[i - 1] == to[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitution});
            diagonal = above;
        }
    }
    return row[to.size()];
}

// Names within `maxDistance` edits of `input` (or starting with it), closest first.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& names,
                                        std::size_t maxDistance,
                                        std::size_t maxResults = 3) {
    std::vector<std::pair<std::size_t, std::string>> ranked;
    for (const auto& name : names) {
        if (name.empty()) continue;
        const std::size_t d = name.rfind(input, 0) == 0 ? 0 : editDistance(input, name);
        if (d <= maxDistance) ranked.emplace_back(d, name);
    }
    std::sort(ranked.begin(), ranked.end());

    std::vector<std::string> out;
    for (auto& r : ranked) {
        if (out.size() >= maxResults) break;
        out.push_back(std::move(r.second));
    }
    return out;
}

} // namespace parg::utils

#endif // PARG_UTILS_HPP
