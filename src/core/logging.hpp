/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace warden::control {
struct LogConfig;
}

namespace warden::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger from config. Console output unless `output` names
// a directory, in which case a rotating warden.log (text or JSON) is written.
quill::Logger* init_logger(const warden::control::LogConfig& config);

// Flush and stop the backend thread (called at exit)
void shutdown_logging();

// Process logger; falls back to a console logger if init_logger was never called
quill::Logger* get_logger();

// UUID v4 based correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_uuid(std::string_view uuid);

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Debug logging (eliminated in release builds)
#undef LOG_DEBUG
#if defined(NDEBUG)
#define LOG_DEBUG(logger, message, ...) ((void)0)
#else
#define LOG_DEBUG(logger, message, ...) LOG_INFO(logger, "DEBUG: " message, ##__VA_ARGS__)
#endif

}  // namespace warden::logging
