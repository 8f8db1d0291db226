/**
 * @file ShutdownSignal.hpp
 * @brief Process-wide stop request raised by SIGINT/SIGTERM.
 *
 * The signal handler only sets a lock-free flag. Whoever owns the server
 * waits on the flag from an ordinary thread and performs the shutdown there.
 */
#pragma once

#include <chrono>

namespace logicchat::app {

/** @brief Installs SIGINT and SIGTERM handlers that call RequestShutdown(). */
void InstallShutdownHandlers();

void RequestShutdown();
bool ShutdownRequested();

/** @brief Clears a previous request. */
void ResetShutdown();

/** @brief Blocks until a shutdown is requested, checking at the given interval. */
void WaitForShutdown(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));

} // namespace logicchat::app
