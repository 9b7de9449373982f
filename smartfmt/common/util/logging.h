// Copyright 2026 The smartfmt Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Single include point for logging and runtime checks.
// Policy decisions are traced with VLOG(1) (why a trigger was rejected) and
// VLOG(2) (what was dispatched); enable with --v=1 or --vmodule.

#ifndef SMARTFMT_COMMON_UTIL_LOGGING_H_
#define SMARTFMT_COMMON_UTIL_LOGGING_H_

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#include "absl/log/check.h"  // IWYU pragma: export
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include "absl/log/log.h"  // IWYU pragma: export

#endif  // SMARTFMT_COMMON_UTIL_LOGGING_H_
