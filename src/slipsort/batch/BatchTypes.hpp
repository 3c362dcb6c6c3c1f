#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace slipsort
{

enum class AcquisitionMethod
{
    Direct,
    Ocr
};

enum class MatchMethod
{
    Exact,
    Fuzzy,
    None
};

// Idle -> Running -> {Completed | Cancelled | Failed}
enum class BatchState
{
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* toString(AcquisitionMethod method);
const char* toString(MatchMethod method);
const char* toString(BatchState state);

struct BatchOptions
{
    bool use_fuzzy_matching = false;
    int ocr_text_threshold = 50;        // code points after trimming
    double fuzzy_score_threshold = 75.0; // 0-100, accepted when score >= threshold
    std::size_t fuzzy_candidate_limit = 5;
    double ocr_upscale_factor = 2.0;
    std::string ocr_language = "por";
};

// Per-page bookkeeping; lives for one loop iteration unless a record sink keeps it.
struct PageRecord
{
    int page_index = 0;
    std::string text;
    AcquisitionMethod acquisition = AcquisitionMethod::Direct;
    std::optional<std::string> identity;
    MatchMethod match_method = MatchMethod::None;
    std::optional<double> score;
    std::optional<std::string> output_path;
};

struct BatchResult
{
    int total_pages = 0;
    int pages_processed = 0;
    int identified_pages = 0;
    int unidentified_pages = 0;
    std::set<std::string> identities_found;
    std::vector<std::string> errors;
    std::vector<std::string> outputs;
    BatchState final_state = BatchState::Idle;
};

using ProgressSink = std::function<void(int current, int total)>;
using CancelPoll = std::function<bool()>;
using RecordSink = std::function<void(const PageRecord& record)>;

// A systemic failure (output location unusable) stopped the batch. The pages
// handled before the failure are in partial().
class BatchAbortedError : public std::runtime_error
{
public:
    BatchAbortedError(const std::string& what, BatchResult partial)
        : std::runtime_error(what)
        , partial_(std::move(partial))
    {
    }

    const BatchResult& partial() const noexcept { return partial_; }

private:
    BatchResult partial_;
};

} // namespace slipsort
