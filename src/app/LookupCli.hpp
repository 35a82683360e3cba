#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace app
{

/// item-lookup [--config <file>] [--threshold <th>] [--exact] <target> <candidate>...
///
/// Resolves <target> against the candidates and prints the matching one.
class LookupCli
{
public:
    enum ExitCode : int
    {
        Found = 0,
        NotFound = 1,
        Suggested = 2,
        Usage = 64,
        ConfigError = 78
    };

    LookupCli(int argc, char** argv, std::ostream& out, std::ostream& err);

    int run();

private:
    bool parseArgs();
    void printUsage() const;
    int lookupExact() const;
    int lookupSimilar(double threshold) const;

    std::vector<std::string> args_;
    std::ostream& out_;
    std::ostream& err_;

    std::optional<std::string> config_path_;
    std::optional<double> threshold_;
    bool exact_ = false;
    std::string target_;
    std::vector<std::string> candidates_;
};

} // namespace app
