#pragma once

#include "IFuzzyMatcher.hpp"
#include "ITextNormalizer.hpp"
#include <memory>

namespace processing
{

/**
 * @brief Fuzzy matcher for person names in page text.
 *
 * This implementation:
 * - Normalizes both sides with NameNormalizer (NFKC, upper case, collapsed whitespace)
 * - Wraps rapidfuzz-cpp algorithms; scores stay on rapidfuzz's 0-100 scale
 * - Caches the normalized query when scoring many candidates
 *
 * Example:
 * @code
 * NameFuzzyMatcher matcher;
 * double score = matcher.similarity("Silva, Joao", "JOAO SILVA", MatchAlgorithm::TokenSetRatio); // 100
 * @endcode
 */
class NameFuzzyMatcher : public IFuzzyMatcher
{
public:
    NameFuzzyMatcher();
    ~NameFuzzyMatcher() override;

    std::optional<MatchResult> findBestMatch(const std::string& query, const std::vector<std::string>& candidates,
                                              double threshold,
                                              MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    std::vector<MatchResult> extractTop(const std::string& query, const std::vector<std::string>& candidates,
                                        std::size_t limit,
                                        MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    double similarity(const std::string& s1, const std::string& s2,
                      MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

private:
    std::unique_ptr<ITextNormalizer> normalizer_;

    std::vector<MatchResult> scoreAll(const std::string& query, const std::vector<std::string>& candidates,
                                      MatchAlgorithm algorithm) const;

    double callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const;
};

} // namespace processing
