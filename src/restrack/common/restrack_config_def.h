// Copyright 2025 The Restrack Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// This header file is used to avoid code duplication.
// It can be included multiple times in restrack_config.h, and each inclusion
// could use a different definition of the RESTRACK_CONFIG macro.
// Macro definition format: RESTRACK_CONFIG(type, name, default_value).
// NOTE: This file should NOT be included in any file other than restrack_config.h
// and restrack_config.cc.

/// Path of the restrack_registry executable. Empty means look it up next to the
/// running binary, then on PATH.
RESTRACK_CONFIG(std::string, registry_executable, "")

/// How long EnsureRunning() waits for the registry to print its readiness line.
RESTRACK_CONFIG(int64_t, registry_startup_timeout_ms, 10000)

/// Default deadline for the registry to exit after Stop() before it is killed.
RESTRACK_CONFIG(int64_t, shutdown_deadline_ms, 1000)

/// How long Stop() waits for the registry to be reaped after SIGKILL.
RESTRACK_CONFIG(int64_t, kill_wait_ms, 1000)

/// How long Probe() waits for the registry's reply.
RESTRACK_CONFIG(int64_t, probe_timeout_ms, 1000)

/// Directory the registry writes its log file into. Empty logs to stderr.
RESTRACK_CONFIG(std::string, registry_log_dir, "")

/// Whether the registry warns about resources still referenced at shutdown.
RESTRACK_CONFIG(bool, report_leaked_resources, true)
