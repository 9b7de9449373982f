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

#include "smartfmt/csharp/CST/csharp-tree-test-util.h"

#include <memory>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/match.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"

namespace csharp {

using smartfmt::Tok;
using smartfmt::Trivia;

using KindTable = absl::flat_hash_map<std::string_view, TokenKind>;

static const KindTable &PunctuationKinds() {
  static const auto *const kTable = new KindTable{
      {"{", kOpenBraceToken},   {"}", kCloseBraceToken},
      {"(", kOpenParenToken},   {")", kCloseParenToken},
      {"[", kOpenBracketToken}, {"]", kCloseBracketToken},
      {";", kSemicolonToken},   {":", kColonToken},
      {",", kCommaToken},       {".", kDotToken},
      {"#", kHashToken},        {"=", kEqualsToken},
      {"==", kEqualsEqualsToken}, {"?", kQuestionToken},
      {"+", kPlusToken},        {"-", kMinusToken},
      {"*", kAsteriskToken},    {"<", kLessThanToken},
      {">", kGreaterThanToken}, {"!", kExclamationToken},
  };
  return *kTable;
}

static const KindTable &KeywordKinds() {
  static const auto *const kTable = new KindTable{
      {"using", kUsingKeyword},   {"namespace", kNamespaceKeyword},
      {"class", kClassKeyword},   {"public", kPublicKeyword},
      {"static", kStaticKeyword}, {"void", kVoidKeyword},
      {"int", kIntKeyword},       {"var", kVarKeyword},
      {"new", kNewKeyword},       {"return", kReturnKeyword},
      {"if", kIfKeyword},         {"else", kElseKeyword},
      {"while", kWhileKeyword},   {"for", kForKeyword},
      {"switch", kSwitchKeyword}, {"case", kCaseKeyword},
      {"default", kDefaultKeyword}, {"break", kBreakKeyword},
      {"region", kRegionKeyword}, {"endregion", kEndRegionKeyword},
      {"from", kFromKeyword},     {"in", kInKeyword},
      {"where", kWhereKeyword},   {"select", kSelectKeyword},
  };
  return *kTable;
}

static TreeFragment FromTable(const KindTable &table, std::string_view text) {
  const auto found = table.find(text);
  CHECK(found != table.end()) << "Unknown token text: " << text;
  return Tok(found->second, text);
}

int ClassifyCSharpTrivia(std::string_view text) {
  return absl::StrContains(text, '\n') ? kEndOfLineTrivia : kWhitespaceTrivia;
}

std::unique_ptr<smartfmt::TextStructure> BuildCSharpText(
    const TreeFragment &root) {
  return smartfmt::BuildTextStructure(root, ClassifyCSharpTrivia);
}

TreeFragment P(std::string_view text) {
  return FromTable(PunctuationKinds(), text);
}

TreeFragment Kw(std::string_view text) {
  return FromTable(KeywordKinds(), text);
}

TreeFragment Id(std::string_view name) { return Tok(kIdentifierToken, name); }

TreeFragment Num(std::string_view digits) {
  return Tok(kNumericLiteralToken, digits);
}

TreeFragment Comment(std::string_view text) {
  return Trivia(absl::StartsWith(text, "//") ? kSingleLineCommentTrivia
                                             : kMultiLineCommentTrivia,
                text);
}

TreeFragment DisabledText(std::string_view text) {
  return Trivia(kDisabledTextTrivia, text);
}

TreeFragment Message(std::string_view text) {
  return Tok(kPreprocessingMessageToken, text);
}

TreeFragment EndOfDirective() { return Tok(kEndOfDirectiveToken, ""); }

TreeFragment MissingTok(int kind) { return Tok(kind, ""); }

}  // namespace csharp
