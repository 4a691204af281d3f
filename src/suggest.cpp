#include "suggest.hpp"
#include <algorithm>

namespace agentsh {

namespace {

struct Match {
    size_t a;
    size_t b;
    size_t size;
};

// Longest common substring of a[alo,ahi) and b[blo,bhi). Ties go to the
// lowest start in a, then in b.
Match longest_match(const std::string& a, size_t alo, size_t ahi,
                    const std::string& b, size_t blo, size_t bhi) {
    Match best{alo, blo, 0};
    size_t width = bhi - blo;
    std::vector<size_t> prev(width + 1, 0);
    std::vector<size_t> cur(width + 1, 0);

    for (size_t i = alo; i < ahi; ++i) {
        for (size_t j = blo; j < bhi; ++j) {
            size_t col = j - blo + 1;
            if (a[i] == b[j]) {
                cur[col] = prev[col - 1] + 1;
                if (cur[col] > best.size) {
                    best = {i + 1 - cur[col], j + 1 - cur[col], cur[col]};
                }
            } else {
                cur[col] = 0;
            }
        }
        std::swap(prev, cur);
    }
    return best;
}

size_t matching_characters(const std::string& a, size_t alo, size_t ahi,
                           const std::string& b, size_t blo, size_t bhi) {
    if (alo >= ahi || blo >= bhi) return 0;
    Match m = longest_match(a, alo, ahi, b, blo, bhi);
    if (m.size == 0) return 0;
    return m.size
        + matching_characters(a, alo, m.a, b, blo, m.b)
        + matching_characters(a, m.a + m.size, ahi, b, m.b + m.size, bhi);
}

} // namespace

double similarity_ratio(const std::string& a, const std::string& b) {
    size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    size_t matches = matching_characters(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

std::vector<std::string> suggest(const std::string& token,
                                 const std::vector<std::string>& candidates,
                                 size_t max,
                                 double threshold) {
    struct Scored {
        double score;
        size_t index;
    };

    std::vector<Scored> scored;
    for (size_t i = 0; i < candidates.size(); ++i) {
        double score = similarity_ratio(token, candidates[i]);
        if (score >= threshold) {
            scored.push_back({score, i});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& x, const Scored& y) {
                         return x.score > y.score;
                     });

    std::vector<std::string> out;
    for (const auto& s : scored) {
        if (out.size() >= max) break;
        out.push_back(candidates[s.index]);
    }
    return out;
}

} // namespace agentsh
