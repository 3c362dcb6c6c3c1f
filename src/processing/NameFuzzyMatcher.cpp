#include "NameFuzzyMatcher.hpp"
#include "NameNormalizer.hpp"
#include "TextUtils.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <algorithm>

namespace processing
{

NameFuzzyMatcher::NameFuzzyMatcher() : normalizer_(std::make_unique<NameNormalizer>())
{
}

NameFuzzyMatcher::~NameFuzzyMatcher() = default;

std::optional<MatchResult> NameFuzzyMatcher::findBestMatch(const std::string& query,
                                                           const std::vector<std::string>& candidates,
                                                           double threshold, MatchAlgorithm algorithm) const
{
    auto scored = scoreAll(query, candidates, algorithm);

    std::optional<MatchResult> best;
    for (auto& result : scored)
    {
        // Strict comparison keeps the earliest candidate on ties
        if (result.score >= threshold && (!best || result.score > best->score))
        {
            best = std::move(result);
        }
    }
    return best;
}

std::vector<MatchResult> NameFuzzyMatcher::extractTop(const std::string& query,
                                                      const std::vector<std::string>& candidates, std::size_t limit,
                                                      MatchAlgorithm algorithm) const
{
    auto results = scoreAll(query, candidates, algorithm);

    // Sort by score (descending), candidate order on ties
    std::stable_sort(results.begin(), results.end(),
                     [](const MatchResult& a, const MatchResult& b) { return a.score > b.score; });

    if (results.size() > limit)
    {
        results.resize(limit);
    }
    return results;
}

double NameFuzzyMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    std::string normalized_s1 = normalizer_->normalize(s1);
    std::string normalized_s2 = normalizer_->normalize(s2);

    return callRapidfuzzAlgorithm(normalized_s1, normalized_s2, algorithm);
}

std::vector<MatchResult> NameFuzzyMatcher::scoreAll(const std::string& query,
                                                    const std::vector<std::string>& candidates,
                                                    MatchAlgorithm algorithm) const
{
    std::vector<MatchResult> results;

    if (candidates.empty() || query.empty())
    {
        return results;
    }

    // Normalize query once; page text can be several kilobytes
    std::string normalized_query = normalizer_->normalize(query);
    if (normalized_query.empty())
    {
        return results;
    }

    results.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const auto& candidate = candidates[i];
        if (candidate.empty())
        {
            continue;
        }

        std::string normalized_candidate = normalizer_->normalize(candidate);
        if (normalized_candidate.empty())
        {
            continue;
        }

        double score = callRapidfuzzAlgorithm(normalized_query, normalized_candidate, algorithm);
        results.push_back(MatchResult{score, candidate, i, algorithm}); // Store original text
    }

    return results;
}

double NameFuzzyMatcher::callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2,
                                                MatchAlgorithm algorithm) const
{
    // Score code points, not bytes: "Ã" must count as one edit, like "A"
    const std::u32string a = utf8ToUtf32(s1);
    const std::u32string b = utf8ToUtf32(s2);

    switch (algorithm)
    {
    case MatchAlgorithm::Ratio:
        return rapidfuzz::fuzz::ratio(a, b);

    case MatchAlgorithm::PartialRatio:
        return rapidfuzz::fuzz::partial_ratio(a, b);

    case MatchAlgorithm::TokenSortRatio:
        return rapidfuzz::fuzz::token_sort_ratio(a, b);

    case MatchAlgorithm::TokenSetRatio:
        return rapidfuzz::fuzz::token_set_ratio(a, b);

    default:
        return rapidfuzz::fuzz::ratio(a, b);
    }
}

} // namespace processing
