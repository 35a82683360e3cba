#include "Similarity.hpp"

#include <rapidfuzz/fuzz.hpp>

namespace lookup
{

double similarityRatio(std::string_view a, std::string_view b)
{
    // Normalize from [0, 100] to [0.0, 1.0]
    return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

struct CachedSimilarity::Impl
{
    explicit Impl(std::string_view fixed)
        : scorer(fixed)
    {
    }

    rapidfuzz::fuzz::CachedRatio<char> scorer;
};

CachedSimilarity::CachedSimilarity(std::string_view fixed)
    : impl_(std::make_unique<Impl>(fixed))
{
}

CachedSimilarity::~CachedSimilarity() = default;

double CachedSimilarity::score(std::string_view candidate) const
{
    return impl_->scorer.similarity(candidate) / 100.0;
}

} // namespace lookup
