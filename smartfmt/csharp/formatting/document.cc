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

#include "smartfmt/csharp/formatting/document.h"

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/csharp/formatting/format-style.h"
#include "smartfmt/csharp/formatting/formatting-rules.h"

namespace csharp {
namespace formatter {

absl::StatusOr<const smartfmt::TextStructureView *>
SnapshotDocument::GetSyntaxTree() const {
  if (text_ == nullptr) {
    return absl::UnavailableError("Document has no syntax tree.");
  }
  return &text_->Data();
}

absl::StatusOr<FormatStyle> SnapshotDocument::GetOptions() const {
  return style_;
}

smartfmt::FormattingRuleChain BaseIndentationRuleFactory::CreateRules(
    const Document &document, int position) const {
  return {std::make_shared<BaseIndentationRule>(base_indentation_)};
}

}  // namespace formatter
}  // namespace csharp
