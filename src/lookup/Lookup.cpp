#include "Lookup.hpp"

#include <cstdlib>

#include <plog/Log.h>

namespace lookup::detail
{

void ensureScoreInRange(double score)
{
    if (score >= 0.0 && score <= 1.0)
        return;

    PLOG_FATAL << "Similarity score out of range [0, 1]: " << score;
    std::abort();
}

Decision decide(double best_score, double threshold)
{
    if (best_score == 1.0)
        return Decision::Exact;

    if (best_score > threshold)
    {
        PLOG_DEBUG << "No exact match; best candidate scored " << best_score << " (threshold " << threshold << ")";
        return Decision::Suggest;
    }

    PLOG_DEBUG << "No candidate above threshold " << threshold << "; best scored " << best_score;
    return Decision::NotFound;
}

} // namespace lookup::detail
