//! # "Did You Mean?" Suggestions
//!
//! Fuzzy matching of misspelled names against the names that exist: builtin
//! functions, the methods of a value kind, or the keywords of a binding.
//! Matching uses case-insensitive Levenshtein distance.

#ifndef STENCIL_DIAGNOSTIC_SUGGEST_HPP
#define STENCIL_DIAGNOSTIC_SUGGEST_HPP

#include "error.hpp"

#include <string>
#include <vector>

namespace stencil::diagnostic {

/// Compute Levenshtein (edit) distance between two strings, ignoring case.
[[nodiscard]] auto levenshtein_distance(const std::string& s1, const std::string& s2) -> size_t;

/// Find the best matching candidate from a list of options.
///
/// Returns the closest match if within `max_distance`, or an empty string.
[[nodiscard]] auto find_similar(const std::string& input,
                                const std::vector<std::string>& candidates,
                                size_t max_distance = 3) -> std::string;

/// Find multiple similar candidates, sorted by distance.
[[nodiscard]] auto find_similar_candidates(const std::string& input,
                                           const std::vector<std::string>& candidates,
                                           size_t max_results = 3, size_t max_distance = 3)
    -> std::vector<std::string>;

/// Adds a "did you mean" note to `error` when a candidate is close to
/// `error.name`.
[[nodiscard]] auto with_suggestion(TemplateError error,
                                   const std::vector<std::string>& candidates) -> TemplateError;

} // namespace stencil::diagnostic

#endif // STENCIL_DIAGNOSTIC_SUGGEST_HPP
