#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the service entry point.
///
/// Provides signal handling, configuration loading and CLI argument
/// parsing for the oas_auth_service executable.

#include <signal.h>

#include <atomic>
#include <chrono>
#include <filesystem>

#include "oas/foundation/config_manager.hpp"
#include "oas/foundation/service_result.hpp"

namespace oas::service {

/// Routes SIGINT and SIGTERM to a process-wide shutdown flag for as long as
/// it lives, then puts the previous dispositions back. One per process.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep for up to @p timeout, returning early when shutdown is
    /// requested. Returns true if shutdown was requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Set the flag as if a signal had arrived.
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void onSignal(int signal);

    struct sigaction previousInt_ {};
    struct sigaction previousTerm_ {};
};

/// Default configuration file location.
inline constexpr const char* kDefaultConfigPath = "/etc/oas/config.yaml";

/// Pick the config file: @p cliPath when non-empty, else the
/// OAS_CONFIG_PATH environment variable, else kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the YAML file chosen by resolveConfigPath() into @p config.
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& cliPath);

/// Parse `--config <path>` or `--config=<path>` from command-line arguments.
/// The last occurrence wins.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace oas::service
