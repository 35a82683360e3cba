#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lookup
{

/// No item satisfied the condition, or no item was similar enough to the target.
class ItemNotFoundError : public std::runtime_error
{
public:
    explicit ItemNotFoundError(const std::string& message = "Failed find item.")
        : std::runtime_error(message)
    {
    }
};

/// More than one item satisfied an exact-match condition.
class MultipleItemFoundError : public std::runtime_error
{
public:
    explicit MultipleItemFoundError(const std::string& message = "Failed to identify item.")
        : std::runtime_error(message)
    {
    }
};

/**
 * @brief A near match was found but not an exact one.
 *
 * Thrown by the fuzzy lookups when the best candidate scores strictly between
 * the threshold and 1.0. The candidate's key(s) are kept so callers can print
 * a "did you mean" hint without parsing what().
 */
class SuggestionError : public ItemNotFoundError
{
public:
    /// (field name, candidate value). Single-key lookups use an empty field name.
    using Suggestion = std::pair<std::string, std::optional<std::string>>;

    static SuggestionError forKey(const std::string& key, double similarity);
    static SuggestionError forFields(std::vector<Suggestion> fields, double similarity);

    const std::vector<Suggestion>& suggestions() const noexcept { return suggestions_; }
    double similarity() const noexcept { return similarity_; }

private:
    SuggestionError(const std::string& message, std::vector<Suggestion> suggestions, double similarity);

    std::vector<Suggestion> suggestions_;
    double similarity_;
};

} // namespace lookup
