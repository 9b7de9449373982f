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

#ifndef SMARTFMT_COMMON_UTIL_CANCELLATION_H_
#define SMARTFMT_COMMON_UTIL_CANCELLATION_H_

#include <atomic>

#include "absl/status/status.h"

namespace smartfmt {

// Cooperative cancellation signal shared between the host that requested an
// operation and the code performing it.
// The host calls Cancel() from any thread; the operation polls Check() at
// each point where it calls out to a collaborator and returns the
// resulting CANCELLED status unchanged.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void Cancel() { cancelled_.store(true, std::memory_order_release); }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Returns CancelledError once Cancel() was called, OkStatus otherwise.
  absl::Status Check() const {
    if (IsCancelled()) return absl::CancelledError("Operation cancelled.");
    return absl::OkStatus();
  }

  // A token that is never cancelled, for callers without a host signal.
  static const CancellationToken &None() {
    static const CancellationToken *const kNone = new CancellationToken();
    return *kNone;
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_UTIL_CANCELLATION_H_
