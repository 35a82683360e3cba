#include "NameUtils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace utils
{

int numDigit(std::int64_t value)
{
    std::string digits = std::to_string(value);
    if (value < 0)
        return static_cast<int>(digits.size() - 1);
    return static_cast<int>(digits.size());
}

std::string ext(const std::string& path)
{
    std::string extension = fs::path(path).extension().string();
    if (!extension.empty() && extension.front() == '.')
        extension.erase(0, 1);
    return extension;
}

std::string getExt(const std::string& path)
{
    std::string basename = fs::path(path).filename().string();
    auto dot = basename.rfind('.');
    if (dot == std::string::npos)
        return basename;
    return basename.substr(dot + 1);
}

double nsToMs(double ns)
{
    return ns * 1.0e-6;
}

std::pair<std::string, std::string> toNsAndName(const std::string& node_name)
{
    auto slash = node_name.rfind('/');
    if (slash == std::string::npos)
        return { "/", node_name };
    return { node_name.substr(0, slash) + "/", node_name.substr(slash + 1) };
}

} // namespace utils
