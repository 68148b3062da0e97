#pragma once

#include "vault/core/result.hpp"

#include <chrono>
#include <string>

namespace vault::pipeline {

/// Single-quote @p text for /bin/sh.
std::string shell_quote(const std::string& text);

/// First word of a shell command line.
std::string program_of(const std::string& command);

/// True when @p program is a path to an executable or found on PATH.
bool resolvable(const std::string& program);

/**
 * @brief Run @p command through /bin/sh and capture its stdout
 *
 * The command runs under coreutils `timeout`; it is sent SIGTERM once
 * @p limit has passed and SIGKILL five seconds later. A zero limit runs
 * it unbounded. stderr is discarded.
 *
 * ERRORS:
 * - Transient: the time limit was hit
 * - Io: the shell could not be started or the command exited non-zero
 */
Result<std::string> run_command(const std::string& command, std::chrono::seconds limit);

} // namespace vault::pipeline
