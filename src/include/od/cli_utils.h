#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace od {
namespace cli_utils {

// Single-character edits needed to turn `a` into `b`.
inline int edit_distance(const std::string& a, const std::string& b) {
    std::vector<int> prev(b.size() + 1);
    std::vector<int> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest flag to `arg`, or "" when nothing is close enough.
inline std::string closest_flag(const std::string& arg, const std::vector<std::string>& flags) {
    int best = std::numeric_limits<int>::max();
    std::string match;
    for (auto const& f : flags) {
        int d = edit_distance(arg, f);
        if (d < best) {
            best = d;
            match = f;
        }
    }
    int threshold = std::max(3, static_cast<int>(arg.size() * 0.4));
    return best <= threshold ? match : std::string();
}

inline std::string unknown_flag_message(const std::string& arg, const std::vector<std::string>& flags) {
    std::string msg = "Unknown argument: " + arg;
    std::string hint = closest_flag(arg, flags);
    if (!hint.empty()) msg += "\n  Did you mean '" + hint + "'?";
    return msg;
}

} // namespace cli_utils
} // namespace od
