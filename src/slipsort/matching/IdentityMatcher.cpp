#include "IdentityMatcher.hpp"
#include "../roster/Roster.hpp"

#include "../../processing/Diagnostics.hpp"
#include "../../processing/NameFuzzyMatcher.hpp"
#include "../../processing/NameNormalizer.hpp"
#include "../../utils/Profile.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace slipsort
{

IdentityMatcher::IdentityMatcher()
    : IdentityMatcher(std::make_unique<processing::NameFuzzyMatcher>(), processing::MatchAlgorithm::TokenSetRatio)
{
}

IdentityMatcher::IdentityMatcher(std::unique_ptr<processing::IFuzzyMatcher> scorer,
                                 processing::MatchAlgorithm algorithm)
    : scorer_(std::move(scorer))
    , normalizer_(std::make_unique<processing::NameNormalizer>())
    , algorithm_(algorithm)
{
}

IdentityMatcher::~IdentityMatcher() = default;

MatchOutcome IdentityMatcher::identify(const std::string& text, const Roster& roster,
                                       const BatchOptions& options) const
{
    PROFILE_SCOPE_FUNCTION();

    MatchOutcome outcome;
    if (roster.empty())
        return outcome;

    std::string canonical_text = normalizer_->normalize(text);
    if (canonical_text.empty())
        return outcome;

    if (auto exact = findExact(canonical_text, roster))
    {
        outcome.identity = std::move(exact);
        outcome.method = MatchMethod::Exact;
        return outcome;
    }

    if (!options.use_fuzzy_matching || !scorer_)
        return outcome;

    const std::size_t limit = std::max<std::size_t>(1, options.fuzzy_candidate_limit);
    auto candidates = scorer_->extractTop(canonical_text, roster.names(), limit, algorithm_);
    if (candidates.empty())
        return outcome;

    if (processing::Diagnostics::IsVerbose())
    {
        for (const auto& candidate : candidates)
        {
            PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                << "Fuzzy candidate '" << candidate.matched << "' score " << candidate.score;
        }
    }

    const double threshold = std::clamp(options.fuzzy_score_threshold, 0.0, 100.0);
    const auto& best = candidates.front();
    if (best.score >= threshold)
    {
        outcome.identity = best.matched;
        outcome.method = MatchMethod::Fuzzy;
        outcome.score = best.score;
    }
    return outcome;
}

std::optional<std::string> IdentityMatcher::findExact(const std::string& canonical_text, const Roster& roster) const
{
    for (const auto& name : roster.names())
    {
        // Roster names are stored canonical already
        if (!name.empty() && canonical_text.find(name) != std::string::npos)
            return name;
    }
    return std::nullopt;
}

} // namespace slipsort
