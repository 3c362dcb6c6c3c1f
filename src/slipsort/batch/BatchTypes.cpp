#include "BatchTypes.hpp"

namespace slipsort
{

const char* toString(AcquisitionMethod method)
{
    switch (method)
    {
    case AcquisitionMethod::Direct:
        return "direct";
    case AcquisitionMethod::Ocr:
        return "ocr";
    }
    return "unknown";
}

const char* toString(MatchMethod method)
{
    switch (method)
    {
    case MatchMethod::Exact:
        return "exact";
    case MatchMethod::Fuzzy:
        return "fuzzy";
    case MatchMethod::None:
        return "none";
    }
    return "unknown";
}

const char* toString(BatchState state)
{
    switch (state)
    {
    case BatchState::Idle:
        return "idle";
    case BatchState::Running:
        return "running";
    case BatchState::Completed:
        return "completed";
    case BatchState::Cancelled:
        return "cancelled";
    case BatchState::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace slipsort
