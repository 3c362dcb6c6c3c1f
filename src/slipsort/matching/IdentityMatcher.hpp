#pragma once

#include "../batch/BatchTypes.hpp"
#include "../../processing/IFuzzyMatcher.hpp"

#include <memory>
#include <optional>
#include <string>

namespace processing
{
class ITextNormalizer;
}

namespace slipsort
{

class Roster;

struct MatchOutcome
{
    std::optional<std::string> identity; // empty means unknown
    MatchMethod method = MatchMethod::None;
    std::optional<double> score;         // fuzzy matches only, 0-100

    bool identified() const { return identity.has_value(); }
};

/**
 * @brief Decides which roster name a page belongs to.
 *
 * 1. Blank text is unknown; no scoring happens.
 * 2. Exact pass: the first roster name (roster order) contained in the
 *    canonicalized page text wins.
 * 3. Fuzzy pass, when enabled: every name is scored against the page, the
 *    best `fuzzy_candidate_limit` are kept (score descending, roster order on
 *    ties) and the top one is accepted when its score >= threshold.
 *
 * An exact hit is never overridden by a higher fuzzy score.
 */
class IdentityMatcher
{
public:
    // Default scorer: NameFuzzyMatcher with token-set ratio.
    IdentityMatcher();
    IdentityMatcher(std::unique_ptr<processing::IFuzzyMatcher> scorer, processing::MatchAlgorithm algorithm);
    ~IdentityMatcher();

    IdentityMatcher(const IdentityMatcher&) = delete;
    IdentityMatcher& operator=(const IdentityMatcher&) = delete;

    MatchOutcome identify(const std::string& text, const Roster& roster, const BatchOptions& options) const;

    processing::MatchAlgorithm algorithm() const { return algorithm_; }

private:
    std::optional<std::string> findExact(const std::string& canonical_text, const Roster& roster) const;

    std::unique_ptr<processing::IFuzzyMatcher> scorer_;
    std::unique_ptr<processing::ITextNormalizer> normalizer_;
    processing::MatchAlgorithm algorithm_;
};

} // namespace slipsort
