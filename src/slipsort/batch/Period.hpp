#pragma once

#include <optional>
#include <string>

namespace slipsort
{

// Reference month of a payroll run, e.g. month "03", year "2024".
struct Period
{
    std::string month; // "01".."12"
    std::string year;  // four digits

    // Year must be four digits and month 1..12 (with or without leading zero).
    static std::optional<Period> parse(const std::string& year, const std::string& month, std::string& outError);

    static Period current();

    // "mm-yyyy"
    std::string label() const { return month + "-" + year; }
};

} // namespace slipsort
