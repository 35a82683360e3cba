#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace utils
{

/// Number of decimal digits of |value|; numDigit(0) == 1.
int numDigit(std::int64_t value);

/// Extension of `path` without the leading dot, using path semantics.
/// "a/b.tar.gz" -> "gz", "README" -> "", ".bashrc" -> ""
std::string ext(const std::string& path);

/// Text after the last '.' of the basename, or the whole basename if it has no dot.
std::string getExt(const std::string& path);

double nsToMs(double ns);

/// Splits a fully qualified node name at its last '/'.
/// "/ns/sub/node" -> {"/ns/sub/", "node"}, "node" -> {"/", "node"}
std::pair<std::string, std::string> toNsAndName(const std::string& node_name);

} // namespace utils
