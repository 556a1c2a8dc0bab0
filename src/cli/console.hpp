/**
 * @file    console.hpp
 * @brief   Console setup, logging and summary output shared by the CLI tools
 * @license MIT
 */

#pragma once

#include "core/batch_export.hpp"

#include <atomic>
#include <string_view>

namespace pwm::cli {

/**
 * Enable UTF-8 output and ANSI colors (Windows); no-op elsewhere
 */
void setup_console();

/**
 * Print the tool banner with its edition line
 */
void print_banner(std::string_view edition);

/**
 * Install the colored stdout logger "pwm" as the spdlog default logger
 *   quiet   -> errors only
 *   verbose -> debug
 *   else    -> info
 */
void init_logging(bool verbose, bool quiet);

/**
 * Print the colored batch summary and the list of failed files
 */
void print_summary(const BatchResult& result);

/**
 * Routes SIGINT to a cancel flag for the lifetime of the object and
 * restores the previous handler on scope exit, including unwinding.
 * Only one instance may be active at a time.
 */
class InterruptScope {
public:
    explicit InterruptScope(std::atomic<bool>& cancel_flag);
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    using Handler = void (*)(int);
    Handler previous_;
};

}  // namespace pwm::cli
