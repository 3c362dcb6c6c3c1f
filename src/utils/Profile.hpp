#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

// SLIPSORT_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + plog)
//   2 = Tracy + Timer (full profiling)

#ifndef SLIPSORT_PROFILING_LEVEL
#define SLIPSORT_PROFILING_LEVEL 0
#endif

#if SLIPSORT_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if SLIPSORT_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if SLIPSORT_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;
#endif

namespace detail
{

#if SLIPSORT_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::high_resolution_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string name_;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
};

/**
 * @brief Accumulates per-page timing statistics and logs a summary every N pages
 *
 * OCR pages are an order of magnitude slower than text pages; the summary keeps
 * min/max visible without one log line per page.
 */
class PageStatsAccumulator
{
public:
    explicit PageStatsAccumulator(std::size_t log_interval = 25) noexcept
        : log_interval_(log_interval)
        , page_count_(0)
        , min_page_time_(std::numeric_limits<double>::max())
        , max_page_time_(0.0)
        , total_page_time_(0.0)
        , start_(std::chrono::high_resolution_clock::now())
    {
    }

    void beginPage() noexcept { start_ = std::chrono::high_resolution_clock::now(); }

    void endPage() noexcept
    {
        auto now = std::chrono::high_resolution_clock::now();
        auto page_duration = std::chrono::duration_cast<std::chrono::microseconds>(now - start_);
        double page_time_ms = page_duration.count() / 1000.0;

        min_page_time_ = std::min(min_page_time_, page_time_ms);
        max_page_time_ = std::max(max_page_time_, page_time_ms);
        total_page_time_ += page_time_ms;
        ++page_count_;

        if (page_count_ >= log_interval_)
        {
            double avg_page_time = total_page_time_ / page_count_;

            PLOG_DEBUG_(profiling::kProfilingLogInstance)
                << "[PROFILE] Page stats (" << page_count_ << " pages): "
                << "avg=" << static_cast<int>(avg_page_time) << "ms, "
                << "min=" << static_cast<int>(min_page_time_) << "ms, "
                << "max=" << static_cast<int>(max_page_time_) << "ms";

            page_count_ = 0;
            min_page_time_ = std::numeric_limits<double>::max();
            max_page_time_ = 0.0;
            total_page_time_ = 0.0;
        }
    }

    PageStatsAccumulator(const PageStatsAccumulator&) = delete;
    PageStatsAccumulator& operator=(const PageStatsAccumulator&) = delete;
    PageStatsAccumulator(PageStatsAccumulator&&) = delete;
    PageStatsAccumulator& operator=(PageStatsAccumulator&&) = delete;

private:
    std::size_t log_interval_;
    std::size_t page_count_;
    double min_page_time_;
    double max_page_time_;
    double total_page_time_;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
};
#endif

#if SLIPSORT_PROFILING_LEVEL >= 2
inline constexpr std::uint16_t clampLength(std::size_t length) noexcept
{
    return length > static_cast<std::size_t>(0xFFFF) ? static_cast<std::uint16_t>(0xFFFF) :
                                                       static_cast<std::uint16_t>(length);
}

inline std::string_view ToStringView(std::string_view name) noexcept { return name; }

inline std::string_view ToStringView(const std::string& name) noexcept { return std::string_view{ name }; }

inline std::string_view ToStringView(const char* name) noexcept
{
    return name ? std::string_view{ name } : std::string_view{};
}

inline void SetThreadName(const char* name) noexcept
{
    if (!name)
        return;
    tracy::SetThreadName(name);
}
#endif

} // namespace detail

} // namespace profiling

#if SLIPSORT_PROFILING_LEVEL == 0
#define PROFILE_SCOPE() ((void)0)
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_PAGE_BEGIN(accumulator) ((void)0)
#define PROFILE_PAGE_END(accumulator) ((void)0)

#elif SLIPSORT_PROFILING_LEVEL == 1
#define PROFILE_SCOPE() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_PAGE_BEGIN(accumulator) (accumulator).beginPage()
#define PROFILE_PAGE_END(accumulator) (accumulator).endPage()

#elif SLIPSORT_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE() \
    ZoneScoped;         \
    ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                                              \
    ZoneScoped;                                                                                                     \
    ::profiling::detail::ScopeTimer __profiling_timer(nameExpr);                                                    \
    if (auto __profiling_scope_name = ::profiling::detail::ToStringView(nameExpr); !__profiling_scope_name.empty()) \
    {                                                                                                               \
        ZoneName(__profiling_scope_name.data(), ::profiling::detail::clampLength(__profiling_scope_name.size()));   \
    }

#define PROFILE_THREAD_NAME(nameExpr) ::profiling::detail::SetThreadName(nameExpr)
#define PROFILE_PAGE_BEGIN(accumulator) (accumulator).beginPage()
#define PROFILE_PAGE_END(accumulator) (accumulator).endPage()

#endif
