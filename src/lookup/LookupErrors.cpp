#include "LookupErrors.hpp"

namespace lookup
{

SuggestionError::SuggestionError(const std::string& message, std::vector<Suggestion> suggestions, double similarity)
    : ItemNotFoundError(message)
    , suggestions_(std::move(suggestions))
    , similarity_(similarity)
{
}

SuggestionError SuggestionError::forKey(const std::string& key, double similarity)
{
    std::string msg = "Arguments may be wrong.";
    msg += " Isn't it '" + key + "'?";
    return SuggestionError(msg, { Suggestion{ std::string(), key } }, similarity);
}

SuggestionError SuggestionError::forFields(std::vector<Suggestion> fields, double similarity)
{
    std::string msg = "Arguments may be wrong. ";
    msg += "Aren't they below?\n";
    for (const auto& [name, value] : fields)
    {
        if (value)
            msg += name + "='" + *value + "'\n";
        else
            msg += name + "=None\n";
    }
    return SuggestionError(msg, std::move(fields), similarity);
}

} // namespace lookup
