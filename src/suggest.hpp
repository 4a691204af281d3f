#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace agentsh {

constexpr size_t kDefaultMaxSuggestions = 3;
constexpr double kDefaultSimilarityThreshold = 0.6;

// Longest-matching-block similarity in [0, 1]: 2*M / (|a| + |b|), where M
// counts characters in blocks found by recursively taking the longest
// common substring. Two empty strings score 1.
double similarity_ratio(const std::string& a, const std::string& b);

// Candidates scoring >= threshold, best first. Equal scores keep the
// order they have in `candidates`.
std::vector<std::string> suggest(const std::string& token,
                                 const std::vector<std::string>& candidates,
                                 size_t max = kDefaultMaxSuggestions,
                                 double threshold = kDefaultSimilarityThreshold);

} // namespace agentsh
