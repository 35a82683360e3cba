#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace lookup
{

/**
 * @brief Normalized similarity of two strings in [0.0, 1.0].
 *
 * Wraps rapidfuzz::fuzz::ratio (normalized Indel similarity,
 * 2 * LCS / (|a| + |b|)) and rescales it from [0, 100].
 * Identical strings score exactly 1.0.
 */
[[nodiscard]] double similarityRatio(std::string_view a, std::string_view b);

/**
 * @brief Scores many candidates against one fixed string.
 *
 * Produces the same values as similarityRatio() but pre-processes the fixed
 * string once, which matters when scanning a whole collection.
 */
class CachedSimilarity
{
public:
    explicit CachedSimilarity(std::string_view fixed);
    ~CachedSimilarity();

    CachedSimilarity(const CachedSimilarity&) = delete;
    CachedSimilarity& operator=(const CachedSimilarity&) = delete;

    [[nodiscard]] double score(std::string_view candidate) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lookup
