#pragma once

namespace config
{
struct LookupConfig;
}

namespace utils
{

/// Owns the process-wide plog logger of the CLI.
///
/// The logger is created on the first Initialize() and never destroyed; it writes
/// through a single forwarding appender whose sinks (log file, optional console)
/// are swapped per session. Shutdown() silences the logger and closes the sinks,
/// so a later Initialize() may point it at a different file.
class LogManager
{
public:
    static bool Initialize(const config::LookupConfig& cfg);
    static void Shutdown();
    static bool IsInitialized();

private:
    LogManager() = default;

    static bool s_initialized;
};

} // namespace utils
