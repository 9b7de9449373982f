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

#ifndef SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_TEST_UTILS_H_
#define SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_TEST_UTILS_H_

#include <memory>
#include <string_view>

#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"

namespace smartfmt {

// Re-lexes 'view' onto 'new_contents', which must differ from the original
// text only in whitespace between tokens (as after applying formatting
// edits).  Non-whitespace tokens keep their kinds and tree positions;
// whitespace is re-split into line terminators and horizontal runs and
// classified with 'classify_trivia'.
// This avoids depending on any lexer for testing.
std::unique_ptr<TextStructure> RespaceTextStructure(
    const TextStructureView &view, std::string_view new_contents,
    const TriviaClassifier &classify_trivia);

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_TEST_UTILS_H_
