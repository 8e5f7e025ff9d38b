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

// Warden Runtime Orchestrator - Header
// Process lifecycle: backend launch, readiness wait, serving, shutdown.

#pragma once

#include "../control/config.hpp"

namespace warden::runtime {

/// Run the supervised proxy until SIGINT/SIGTERM.
///
/// Order: spawn the backend, wait for readiness (a timeout only warns),
/// bind the listener, serve, then drain connections and stop the backend.
/// Returns the process exit status: 0 after a clean shutdown, 1 when the
/// backend cannot be launched or the listener cannot be bound.
[[nodiscard]] int run(const control::Config& config);

}  // namespace warden::runtime
