#include "Period.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace slipsort
{

namespace
{
bool allDigits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}
} // namespace

std::optional<Period> Period::parse(const std::string& year, const std::string& month, std::string& outError)
{
    if (year.size() != 4 || !allDigits(year))
    {
        outError = "Year must have four digits: '" + year + "'";
        return std::nullopt;
    }

    if (month.empty() || month.size() > 2 || !allDigits(month))
    {
        outError = "Month must be a number between 1 and 12: '" + month + "'";
        return std::nullopt;
    }

    int month_value = std::stoi(month);
    if (month_value < 1 || month_value > 12)
    {
        outError = "Month must be a number between 1 and 12: '" + month + "'";
        return std::nullopt;
    }

    std::ostringstream mm;
    mm << std::setw(2) << std::setfill('0') << month_value;
    return Period{mm.str(), year};
}

Period Period::current()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream mm;
    std::ostringstream yyyy;
    mm << std::put_time(&tm_buf, "%m");
    yyyy << std::put_time(&tm_buf, "%Y");
    return Period{mm.str(), yyyy.str()};
}

} // namespace slipsort
