#include "Roster.hpp"
#include "../../processing/NameNormalizer.hpp"
#include "../../processing/TextUtils.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <algorithm>

namespace slipsort
{

Roster Roster::fromNames(const std::vector<std::string>& names)
{
    Roster roster;
    for (const auto& name : names)
    {
        roster.add(name);
    }
    return roster;
}

std::string Roster::canonicalize(const std::string& name)
{
    static const processing::NameNormalizer normalizer;
    return normalizer.normalize(name);
}

bool Roster::add(const std::string& name)
{
    // A mis-decoded name ("ANDR\xC9") would shrink to a prefix of other names
    if (!processing::isValidUtf8(name))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Roster, "Roster name is not valid UTF-8, skipped",
                                            "Re-save the roster file as UTF-8. Readable part: '" +
                                                processing::utf32ToUtf8(processing::utf8ToUtf32(name)) + "'");
        return false;
    }

    std::string canonical = canonicalize(name);
    if (canonical.empty())
        return false;

    if (!index_.insert(canonical).second)
        return false;

    names_.push_back(std::move(canonical));
    return true;
}

bool Roster::remove(const std::string& name)
{
    std::string canonical = canonicalize(name);
    if (index_.erase(canonical) == 0)
        return false;

    names_.erase(std::find(names_.begin(), names_.end(), canonical));
    return true;
}

bool Roster::contains(const std::string& name) const { return index_.count(canonicalize(name)) > 0; }

} // namespace slipsort
