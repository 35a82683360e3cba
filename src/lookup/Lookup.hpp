#pragma once

#include "CollectionUtils.hpp"
#include "LookupErrors.hpp"
#include "Similarity.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lookup
{

/// Similarity a fuzzy candidate must exceed to be offered as a suggestion.
inline constexpr double kDefaultSimilarityThreshold = 0.6;

/// Default target of a multi-key lookup: field name -> wanted value, iterated in key order.
/// Any sized range of (name, value) pairs works, e.g. a vector to keep the caller's order.
using FieldTargets = std::map<std::string, std::string>;

/// What a keys extractor returns for one item. A null value scores 0.0.
using FieldValues = std::map<std::string, std::optional<std::string>>;

namespace detail
{

enum class Decision
{
    Exact,
    Suggest,
    NotFound
};

/// Aborts the process if `score` lies outside [0, 1].
void ensureScoreInRange(double score);

/// Applies the threshold policy to the best score of a fuzzy scan.
Decision decide(double best_score, double threshold);

inline const std::string* valueOrNull(const std::string& value)
{
    return &value;
}

inline const std::string* valueOrNull(const std::optional<std::string>& value)
{
    return value ? &*value : nullptr;
}

template <typename Fields>
const std::string* findField(const Fields& fields, const std::string& name)
{
    auto it = fields.find(name);
    if (it == fields.end())
        return nullptr;
    return valueOrNull(it->second);
}

} // namespace detail

/**
 * @brief Get the single item that matches the condition.
 *
 * @param condition Predicate applied to every item
 * @param items Collection to search; nullptr is treated as an empty collection
 * @return Copy of the only matching item
 * @throws ItemNotFoundError No item matches
 * @throws MultipleItemFoundError Two or more items match
 */
template <typename Container, typename Predicate>
typename Container::value_type findOne(Predicate&& condition, const Container* items)
{
    if (items == nullptr)
        throw ItemNotFoundError();

    auto filtered = filterItems(std::forward<Predicate>(condition), *items);
    if (filtered.empty())
        throw ItemNotFoundError();
    if (filtered.size() >= 2)
        throw MultipleItemFoundError();

    return filtered.front();
}

template <typename Container, typename Predicate>
typename Container::value_type findOne(Predicate&& condition, const Container& items)
{
    return findOne(std::forward<Predicate>(condition), &items);
}

/**
 * @brief Find the item whose key is most similar to `target_name`.
 *
 * Every item is scored with similarityRatio(key(item), target_name). The first
 * item reaching the highest score is the candidate.
 *
 * @param target_name Name the caller is looking for
 * @param items Collection to search
 * @param key Maps an item to its name (identity by default)
 * @param th Threshold a near match must exceed to be suggested
 * @return The candidate when its score is exactly 1.0
 * @throws SuggestionError th < score < 1.0; carries the candidate's key
 * @throws ItemNotFoundError Empty collection, or score <= th
 */
template <typename Container, typename KeyFn = std::identity>
typename Container::value_type findSimilarOne(const std::string& target_name, const Container& items,
                                              KeyFn key = {}, double th = kDefaultSimilarityThreshold)
{
    CachedSimilarity scorer(target_name);

    double similarity = 0.0;
    const typename Container::value_type* most_similar = nullptr;
    for (const auto& item : items)
    {
        double score = scorer.score(key(item));
        detail::ensureScoreInRange(score);
        if (score > similarity)
        {
            similarity = score;
            most_similar = &item;
        }
    }

    if (most_similar == nullptr)
        throw ItemNotFoundError();

    switch (detail::decide(similarity, th))
    {
    case detail::Decision::Exact:
        return *most_similar;
    case detail::Decision::Suggest:
        throw SuggestionError::forKey(std::string(key(*most_similar)), similarity);
    case detail::Decision::NotFound:
        break;
    }
    throw ItemNotFoundError();
}

/**
 * @brief Find the item most similar to a target described by several fields.
 *
 * An item's score is the mean of the per-field similarities over exactly the
 * fields named in `target_names`. A field the item lacks, or holds as null,
 * scores 0.0. Ties and thresholds behave as in findSimilarOne().
 *
 * @param target_names (field name, wanted value) pairs; their order is the order of the
 *        suggestion lines
 * @param items Collection to search
 * @param keys Maps an item to its field values (identity by default)
 * @param th Threshold a near match must exceed to be suggested
 * @throws SuggestionError Carries every requested field with the candidate's value
 * @throws ItemNotFoundError Empty collection, no requested fields, or score <= th
 */
template <typename Targets = FieldTargets, typename Container, typename KeysFn = std::identity>
typename Container::value_type findSimilarOneMultiKeys(const Targets& target_names, const Container& items,
                                                       KeysFn keys = {}, double th = kDefaultSimilarityThreshold)
{
    double max_similarity = 0.0;
    const typename Container::value_type* most_similar = nullptr;
    for (const auto& item : items)
    {
        const auto& fields = keys(item);

        double total = 0.0;
        for (const auto& [name, target] : target_names)
        {
            double score = 0.0;
            if (const std::string* value = detail::findField(fields, name))
                score = similarityRatio(*value, target);
            detail::ensureScoreInRange(score);
            total += score;
        }

        double mean = target_names.empty() ? 0.0 : total / static_cast<double>(target_names.size());
        if (mean > max_similarity)
        {
            max_similarity = mean;
            most_similar = &item;
        }
    }

    if (most_similar == nullptr)
        throw ItemNotFoundError();

    detail::ensureScoreInRange(max_similarity);
    switch (detail::decide(max_similarity, th))
    {
    case detail::Decision::Exact:
        return *most_similar;
    case detail::Decision::Suggest:
    {
        const auto& fields = keys(*most_similar);
        std::vector<SuggestionError::Suggestion> suggestions;
        suggestions.reserve(target_names.size());
        for (const auto& [name, target] : target_names)
        {
            const std::string* value = detail::findField(fields, name);
            suggestions.emplace_back(name, value ? std::optional<std::string>(*value) : std::nullopt);
        }
        throw SuggestionError::forFields(std::move(suggestions), max_similarity);
    }
    case detail::Decision::NotFound:
        break;
    }
    throw ItemNotFoundError();
}

} // namespace lookup
