#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Fuzzy matching algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Ratio,          // Simple Levenshtein-based ratio (general purpose)
    PartialRatio,   // Partial substring matching (e.g., "SILVA" matches "JOAO SILVA SANTOS")
    TokenSortRatio, // Order-independent token matching (e.g., "A B" matches "B A")
    TokenSetRatio   // Set-based token matching; a short name inside a long page scores high
};

/**
 * @brief Result of a fuzzy matching operation.
 */
struct MatchResult
{
    double score = 0.0;        // Similarity score on the 0-100 scale
    std::string matched;       // The original candidate text that was matched
    std::size_t index = 0;     // Position of the candidate in the input list
    MatchAlgorithm algorithm = MatchAlgorithm::Ratio;
};

/**
 * @brief Abstract interface for fuzzy string matchers.
 *
 * Scores are on the 0-100 scale used by the matching thresholds in the
 * configuration. Implementations normalize both sides before scoring.
 *
 * Typical use cases:
 * - Scoring a noisy OCR page against every roster name
 * - Picking the top-K candidates for a threshold decision
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Find the best matching candidate at or above the threshold.
     *
     * Ties keep the earliest candidate.
     *
     * @param query The query string to match against candidates
     * @param candidates List of candidate strings to search
     * @param threshold Minimum similarity score [0, 100] required for a match
     * @param algorithm The matching algorithm to use
     * @return The best match if score >= threshold, otherwise std::nullopt
     */
    virtual std::optional<MatchResult> findBestMatch(const std::string& query,
                                                      const std::vector<std::string>& candidates, double threshold,
                                                      MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Score every candidate and keep the `limit` best.
     *
     * @return Up to `limit` results sorted by score (descending); equal scores
     *         keep candidate order.
     */
    virtual std::vector<MatchResult> extractTop(const std::string& query,
                                                const std::vector<std::string>& candidates, std::size_t limit,
                                                MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Calculate similarity between two strings.
     *
     * @return Similarity score on the 0-100 scale; 0 if either side is empty
     */
    virtual double similarity(const std::string& s1, const std::string& s2,
                              MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;
};

} // namespace processing
