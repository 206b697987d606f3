/// @file service_runner.cpp
/// @brief Signal handling, config discovery and argument parsing for the
///        service executable.

#include "oas/service/service_runner.hpp"

#include <algorithm>
#include <cstdlib>
#include <string_view>
#include <thread>

namespace oas::service {

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::onSignal(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = &SignalHandler::onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, &previousInt_);
    sigaction(SIGTERM, &action, &previousTerm_);
}

SignalHandler::~SignalHandler() {
    sigaction(SIGINT, &previousInt_, nullptr);
    sigaction(SIGTERM, &previousTerm_, nullptr);
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

bool SignalHandler::waitFor(std::chrono::milliseconds timeout) const {
    constexpr std::chrono::milliseconds kPollInterval{50};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (shutdownRequested()) {
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(
            std::min(kPollInterval,
                     std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    if (const char* fromEnv = std::getenv("OAS_CONFIG_PATH"); fromEnv && *fromEnv) {
        return fromEnv;
    }
    return kDefaultConfigPath;
}

foundation::ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& cliPath) {
    return config.load(resolveConfigPath(cliPath));
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    constexpr std::string_view kFlag = "--config";
    std::filesystem::path found;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kFlag && i + 1 < argc) {
            found = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg.size() > kFlag.size() && arg.substr(0, kFlag.size()) == kFlag &&
                   arg[kFlag.size()] == '=') {
            found = std::filesystem::path(arg.substr(kFlag.size() + 1));
        }
    }
    return found;
}

}  // namespace oas::service
