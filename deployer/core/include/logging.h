/*
 * File:        logging.h
 * Module:      deployer-core
 * Purpose:     Logging system
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 The contract-deployer authors
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace deployer {

/// Initialize the logging system
/// Should be called once at application startup
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the default logger (created on first use)
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

} // namespace deployer

// Convenient logging macros
#define DEPLOYER_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(deployer::get_logger(), __VA_ARGS__)
#define DEPLOYER_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(deployer::get_logger(), __VA_ARGS__)
#define DEPLOYER_LOG_INFO(...)     SPDLOG_LOGGER_INFO(deployer::get_logger(), __VA_ARGS__)
#define DEPLOYER_LOG_WARN(...)     SPDLOG_LOGGER_WARN(deployer::get_logger(), __VA_ARGS__)
#define DEPLOYER_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(deployer::get_logger(), __VA_ARGS__)
#define DEPLOYER_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(deployer::get_logger(), __VA_ARGS__)

#define LOG_TRACE(...)    DEPLOYER_LOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...)    DEPLOYER_LOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)     DEPLOYER_LOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)     DEPLOYER_LOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...)    DEPLOYER_LOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) DEPLOYER_LOG_CRITICAL(__VA_ARGS__)
