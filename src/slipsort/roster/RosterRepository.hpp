#pragma once

#include <string>

namespace slipsort
{

class Roster;

// Flat UTF-8 roster file, one name per line.
class RosterRepository {
public:
    explicit RosterRepository(const std::string& path = "all_employee.txt");

    // Appends names from the file; blank lines are skipped. False if the file
    // is missing or unreadable.
    bool load(Roster& out_roster) const;

    // Writes the names sorted, via a temp file renamed over the target.
    bool save(const Roster& roster) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace slipsort
