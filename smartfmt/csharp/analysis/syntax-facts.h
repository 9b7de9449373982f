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

#ifndef SMARTFMT_CSHARP_ANALYSIS_SYNTAX_FACTS_H_
#define SMARTFMT_CSHARP_ANALYSIS_SYNTAX_FACTS_H_

#include <memory>
#include <utility>

#include "re2/re2.h"
#include "smartfmt/common/text/text-structure.h"

namespace csharp {

// Language facts that depend on more than a single token.
class SyntaxFacts {
 public:
  virtual ~SyntaxFacts() = default;

  // True if 'offset' lies in code that the user does not edit directly,
  // such as generated or disabled regions.
  virtual bool IsInNonUserCode(const smartfmt::TextStructureView &view,
                               int offset) const = 0;
};

// Non-user code is disabled text (inactive preprocessor branches), and the
// contents of any #region whose message matches 'non_user_code_region',
// from its 'region' keyword up to the matching 'endregion' keyword.
// Regions are nested.  A null pattern disables region matching.
class CSharpSyntaxFacts : public SyntaxFacts {
 public:
  explicit CSharpSyntaxFacts(
      std::shared_ptr<const re2::RE2> non_user_code_region)
      : non_user_code_region_(std::move(non_user_code_region)) {}

  bool IsInNonUserCode(const smartfmt::TextStructureView &view,
                       int offset) const final;

 private:
  bool IsNonUserRegion(const smartfmt::SyntaxToken &region_keyword) const;

  std::shared_ptr<const re2::RE2> non_user_code_region_;
};

}  // namespace csharp

#endif  // SMARTFMT_CSHARP_ANALYSIS_SYNTAX_FACTS_H_
