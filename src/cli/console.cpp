/**
 * @file    console.cpp
 * @brief   Console setup, logging and summary output shared by the CLI tools
 * @license MIT
 */

#include "cli/console.hpp"
#include "utils/ascii_logo.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <csignal>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace pwm::cli {

namespace {

std::atomic<std::atomic<bool>*> g_interrupt_flag{nullptr};

extern "C" void on_interrupt(int) {
    if (auto* flag = g_interrupt_flag.load()) {
        flag->store(true);
    }
}

}  // anonymous namespace

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

// =============================================================================
// Banner and logging
// =============================================================================

void print_banner(std::string_view edition) {
    fmt::print(fmt::fg(fmt::color::medium_purple), "{}", pwm::ASCII_BANNER);
    fmt::print(fmt::fg(fmt::color::gray), "  Version: {}\n", APP_VERSION);
    fmt::print(fmt::fg(fmt::color::yellow), "  *** {} ***\n", edition);
    fmt::print("\n");
}

void init_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("pwm");
    if (!logger) {
        logger = spdlog::stdout_color_mt("pwm");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

// =============================================================================
// Summary
// =============================================================================

void print_summary(const BatchResult& result) {
    fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", result.succeeded.size());
    if (!result.failed.empty()) {
        fmt::print(fmt::fg(fmt::color::red), ", {} failed", result.failed.size());
    }
    if (!result.skipped.empty()) {
        fmt::print(fmt::fg(fmt::color::yellow), ", {} skipped", result.skipped.size());
    }
    if (result.cancelled) {
        fmt::print(fmt::fg(fmt::color::yellow), " (cancelled)");
    }
    fmt::print("\n");

    for (const auto& failure : result.failed) {
        fmt::print(fmt::fg(fmt::color::red), "  [FAIL] {} ({}): {}\n",
                   failure.path.filename(), to_string(failure.code), failure.reason);
    }
}

// =============================================================================
// SIGINT routing
// =============================================================================

InterruptScope::InterruptScope(std::atomic<bool>& cancel_flag) {
    cancel_flag.store(false);
    g_interrupt_flag.store(&cancel_flag);
    previous_ = std::signal(SIGINT, on_interrupt);
    if (previous_ == SIG_ERR) {
        spdlog::warn("Cannot install SIGINT handler, Ctrl+C will not cancel cleanly");
        previous_ = SIG_DFL;
    }
}

InterruptScope::~InterruptScope() {
    std::signal(SIGINT, previous_);
    g_interrupt_flag.store(nullptr);
}

}  // namespace pwm::cli
