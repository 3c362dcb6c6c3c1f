#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace slipsort
{

/**
 * @brief Ordered set of canonical person names.
 *
 * Names are stored in canonical form (NFKC, upper case, trimmed, inner
 * whitespace collapsed) so " joão  silva" and "JOÃO SILVA" are one entry.
 * Insertion order is kept: exact matching walks the roster in this order.
 */
class Roster
{
public:
    Roster() = default;

    static Roster fromNames(const std::vector<std::string>& names);

    /// Canonical form used for storage and comparison.
    static std::string canonicalize(const std::string& name);

    /// False if the name is not valid UTF-8, empty after canonicalization or
    /// already present.
    bool add(const std::string& name);
    bool remove(const std::string& name);
    bool contains(const std::string& name) const;

    const std::vector<std::string>& names() const { return names_; }
    std::size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

private:
    std::vector<std::string> names_;
    std::unordered_set<std::string> index_;
};

} // namespace slipsort
