#pragma once

#include <iterator>
#include <utility>
#include <vector>

namespace lookup
{

/// Items of `items` satisfying `condition`, in their original order.
template <typename Container, typename Predicate>
std::vector<typename Container::value_type> filterItems(Predicate&& condition, const Container& items)
{
    std::vector<typename Container::value_type> filtered;
    for (const auto& item : items)
    {
        if (condition(item))
            filtered.push_back(item);
    }
    return filtered;
}

/// A null collection is treated as empty.
template <typename Container, typename Predicate>
std::vector<typename Container::value_type> filterItems(Predicate&& condition, const Container* items)
{
    if (items == nullptr)
        return {};
    return filterItems(std::forward<Predicate>(condition), *items);
}

/// Concatenates an iterable of iterables into a single vector.
template <typename Nested>
auto flatten(const Nested& nested)
{
    using Inner = typename Nested::value_type;
    std::vector<typename Inner::value_type> flat;
    for (const auto& inner : nested)
        flat.insert(flat.end(), std::begin(inner), std::end(inner));
    return flat;
}

} // namespace lookup
