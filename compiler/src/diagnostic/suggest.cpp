#include "diagnostic/suggest.hpp"

#include <algorithm>
#include <cctype>

namespace stencil::diagnostic {

namespace {

auto length_difference(const std::string& a, const std::string& b) -> size_t {
    return a.length() > b.length() ? a.length() - b.length() : b.length() - a.length();
}

} // namespace

auto levenshtein_distance(const std::string& s1, const std::string& s2) -> size_t {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Two rows are enough
    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

auto find_similar(const std::string& input, const std::vector<std::string>& candidates,
                  size_t max_distance) -> std::string {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        if (length_difference(input, candidate) > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

auto find_similar_candidates(const std::string& input, const std::vector<std::string>& candidates,
                             size_t max_results, size_t max_distance)
    -> std::vector<std::string> {
    if (input.empty() || candidates.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    scored.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        if (length_difference(input, candidate) > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(std::min(max_results, scored.size()));
    for (size_t i = 0; i < max_results && i < scored.size(); ++i) {
        result.push_back(scored[i].first);
    }

    return result;
}

auto with_suggestion(TemplateError error, const std::vector<std::string>& candidates)
    -> TemplateError {
    // Short names match almost anything within three edits.
    size_t max_distance = std::min<size_t>(3, std::max<size_t>(1, error.name.length() / 2));
    std::string similar = find_similar(error.name, candidates, max_distance);
    if (similar.empty() || similar == error.name) {
        return error;
    }
    return error.with_note("did you mean `" + similar + "`?");
}

} // namespace stencil::diagnostic
