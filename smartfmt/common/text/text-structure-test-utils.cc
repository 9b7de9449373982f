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

#include "smartfmt/common/text/text-structure-test-utils.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/common/text/tree-utils.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

namespace {

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

bool IsWhitespaceText(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), IsSpace);
}

// Splits a whitespace run into line terminators and horizontal runs.
void AppendWhitespaceTokens(std::string_view run,
                            const TriviaClassifier &classify,
                            TokenSequence *tokens) {
  while (!run.empty()) {
    size_t length;
    if (run[0] == '\n') {
      length = 1;
    } else if (run.substr(0, 2) == "\r\n") {
      length = 2;
    } else {
      length = std::min(run.find_first_of("\r\n", 1), run.length());
    }
    const std::string_view text = run.substr(0, length);
    tokens->emplace_back(classify(text), text);
    run.remove_prefix(length);
  }
}

SymbolPtr CloneTree(const Symbol &symbol,
                    const std::vector<TokenInfo> &leaf_tokens, size_t *next) {
  if (symbol.Kind() == SymbolKind::kLeaf) {
    CHECK_LT(*next, leaf_tokens.size());
    return Leaf(leaf_tokens[(*next)++]);
  }
  auto node = std::make_unique<SyntaxTreeNode>(symbol.Tag().tag);
  for (const auto &child : SymbolCastToNode(symbol).children()) {
    node->AppendChild(child == nullptr ? nullptr
                                       : CloneTree(*child, leaf_tokens, next));
  }
  return node;
}

}  // namespace

std::unique_ptr<TextStructure> RespaceTextStructure(
    const TextStructureView &view, std::string_view new_contents,
    const TriviaClassifier &classify_trivia) {
  const auto &leaves = view.Leaves();
  std::vector<TokenInfo> leaf_tokens;
  leaf_tokens.reserve(leaves.size());
  TokenSequence tokens;
  size_t pos = 0;
  for (const TokenInfo &old_token : view.TokenStream()) {
    if (IsWhitespaceText(old_token.text())) continue;

    size_t space_end = pos;
    while (space_end < new_contents.length() &&
           IsSpace(new_contents[space_end])) {
      ++space_end;
    }
    AppendWhitespaceTokens(new_contents.substr(pos, space_end - pos),
                           classify_trivia, &tokens);
    pos = space_end;

    const std::string_view text =
        new_contents.substr(pos, old_token.text().length());
    CHECK_EQ(text, old_token.text())
        << "Contents differ beyond whitespace at offset " << pos;
    const TokenInfo token(old_token.token_enum(), text);
    tokens.push_back(token);
    pos += text.length();

    if (leaf_tokens.size() < leaves.size() &&
        leaves[leaf_tokens.size()]->get() == old_token) {
      leaf_tokens.push_back(token);
    }
  }
  AppendWhitespaceTokens(new_contents.substr(pos), classify_trivia, &tokens);
  CHECK_EQ(leaf_tokens.size(), leaves.size())
      << "Every leaf must appear in the token stream.";

  ConcreteSyntaxTree tree;
  if (view.SyntaxTree() != nullptr) {
    size_t next = 0;
    tree = CloneTree(*view.SyntaxTree(), leaf_tokens, &next);
  }
  return std::make_unique<TextStructure>(new_contents, std::move(tokens),
                                         std::move(tree));
}

}  // namespace smartfmt
