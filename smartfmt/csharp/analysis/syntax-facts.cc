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

#include "smartfmt/csharp/analysis/syntax-facts.h"

#include <algorithm>
#include <vector>

#include "re2/re2.h"
#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/statement.h"

namespace csharp {

using smartfmt::SyntaxToken;
using smartfmt::SyntaxTreeLeaf;
using smartfmt::TextStructureView;
using smartfmt::TokenInfo;

bool CSharpSyntaxFacts::IsNonUserRegion(
    const SyntaxToken &region_keyword) const {
  if (non_user_code_region_ == nullptr) return false;
  const SyntaxTreeLeaf *message =
      GetRegionDirectiveMessage(*region_keyword.Parent());
  return message != nullptr &&
         RE2::PartialMatch(message->get().text(), *non_user_code_region_);
}

bool CSharpSyntaxFacts::IsInNonUserCode(const TextStructureView &view,
                                        int offset) const {
  const TokenInfo *trivia = view.FindStreamTokenAt(offset);
  if (trivia != nullptr && trivia->token_enum() == kDisabledTextTrivia) {
    VLOG(2) << "Offset " << offset << " is in disabled text.";
    return true;
  }
  if (non_user_code_region_ == nullptr) return false;

  // One entry per open #region, innermost last.
  std::vector<bool> open_regions;
  for (const SyntaxTreeLeaf *leaf : view.Leaves()) {
    if (view.StartOffset(leaf->get()) >= offset) break;
    const SyntaxToken token = view.MakeToken(*leaf);
    if (!IsRegionDirectiveParent(token)) continue;
    if (token.Kind() == kRegionKeyword) {
      open_regions.push_back(IsNonUserRegion(token));
    } else if (token.Kind() == kEndRegionKeyword && !open_regions.empty()) {
      open_regions.pop_back();
    }
  }
  const bool result =
      std::find(open_regions.begin(), open_regions.end(), true) !=
      open_regions.end();
  if (result) {
    VLOG(2) << "Offset " << offset << " is in a non-user region.";
  }
  return result;
}

}  // namespace csharp
