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

// Editor formatting: decides whether an editor event (a typed character,
// return, paste, or an explicit request) reformats code, which range it
// reformats, and with which rules.  The whitespace edits themselves come
// from a LayoutEngine.

#ifndef SMARTFMT_CSHARP_FORMATTING_EDITOR_FORMATTING_SERVICE_H_
#define SMARTFMT_CSHARP_FORMATTING_EDITOR_FORMATTING_SERVICE_H_

#include <iosfwd>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/formatting/layout-engine.h"
#include "smartfmt/common/text/text-edit.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/common/util/interval.h"
#include "smartfmt/csharp/analysis/syntax-facts.h"
#include "smartfmt/csharp/formatting/document.h"
#include "smartfmt/csharp/formatting/format-style.h"
#include "smartfmt/csharp/formatting/formatting-range-helper.h"

namespace csharp {
namespace formatter {

// 'ch' was typed, leaving the caret at byte offset 'caret'.
struct TypedCharacterEvent {
  char ch;
  int caret;
};

// Return was pressed with the caret at 'caret' (after the new line break).
struct ReturnEvent {
  int caret;
};

// Text was pasted into 'span'.
struct PasteEvent {
  smartfmt::Interval<int> span;
};

// Explicit request to format the selection 'span', or the whole document.
struct FormatRequestEvent {
  std::optional<smartfmt::Interval<int>> span;
};

using TriggerEvent = std::variant<TypedCharacterEvent, ReturnEvent,
                                  PasteEvent, FormatRequestEvent>;

std::ostream &operator<<(std::ostream &, const TriggerEvent &);

// Collaborators of EditorFormattingService.
struct EditorFormattingServices {
  // Required.
  std::shared_ptr<const smartfmt::LayoutEngine> layout_engine;

  // Required.
  std::shared_ptr<const RangeResolver> range_resolver;

  // Default rules.  When null, no event produces edits.
  std::shared_ptr<const smartfmt::SyntaxFormattingService> syntax_formatting;

  // When null, there are no host rules.
  std::shared_ptr<const HostRuleFactory> host_rules;

  // When null, a CSharpSyntaxFacts for the document's
  // non_user_code_region is used.
  std::shared_ptr<const SyntaxFacts> syntax_facts;
};

// The reference collaborators: BasicLayoutEngine, StructuralRangeResolver,
// CSharpSyntaxFormattingService, and no host rules.
EditorFormattingServices DefaultCSharpServices();

// Formatting policy for editor events.
//
// Every operation reads only the given document snapshot, builds its rule
// chain afresh, and returns the layout engine's edits unchanged; an empty
// list means nothing to do.  Unavailable collaborators (syntax tree,
// options, services) result in an empty list.  The only error returned is
// CANCELLED, once 'cancel' was signaled.
//
// Instances are immutable and may be shared between threads.
class EditorFormattingService {
 public:
  using Edits = std::vector<smartfmt::TextEdit>;

  explicit EditorFormattingService(EditorFormattingServices services);

  bool SupportsFormatDocument() const { return true; }
  bool SupportsFormatSelection() const { return true; }
  bool SupportsFormatOnPaste() const { return true; }
  bool SupportsFormatOnReturn() const { return true; }

  // True if typing 'ch' may format, given the document's options.
  // False if the options are unavailable.
  bool SupportsFormattingOnTypedCharacter(const Document &document,
                                          char ch) const;

  // Dispatches to one of the operations below.
  absl::StatusOr<Edits> Format(const Document &document,
                               const TriggerEvent &event,
                               const smartfmt::CancellationToken &cancel) const;

  // Formats the construct that the token before 'caret' completes, or at
  // least re-indents that token.
  absl::StatusOr<Edits> GetFormattingChangesOnTypedCharacter(
      const Document &document, char ch, int caret,
      const smartfmt::CancellationToken &cancel) const;

  // Formats only after the ')' of a using statement.
  absl::StatusOr<Edits> GetFormattingChangesOnReturn(
      const Document &document, int caret,
      const smartfmt::CancellationToken &cancel) const;

  // Re-indents the lines of 'span', keeping the spacing within each line.
  absl::StatusOr<Edits> GetFormattingChangesOnPaste(
      const Document &document, smartfmt::Interval<int> span,
      const smartfmt::CancellationToken &cancel) const;

  // Formats the lines of 'span', or the whole document.
  absl::StatusOr<Edits> GetFormattingChanges(
      const Document &document, std::optional<smartfmt::Interval<int>> span,
      const smartfmt::CancellationToken &cancel) const;

 private:
  // Host rules for 'position', then the default rules.
  absl::StatusOr<smartfmt::FormattingRuleChain> GetFormattingRules(
      const Document &document, int position) const;

  bool IsInNonUserCode(const smartfmt::TextStructureView &view,
                       const FormatStyle &style, int offset) const;

  // Formats the range that ends with 'end_token'.  No edits if there is no
  // such range.
  absl::StatusOr<Edits> FormatRange(
      const smartfmt::TextStructureView &view, const FormatStyle &style,
      const smartfmt::SyntaxToken &end_token,
      const smartfmt::FormattingRuleChain &rules,
      const smartfmt::CancellationToken &cancel) const;

  // Formats the gap before 'token'.
  absl::StatusOr<Edits> FormatToken(
      const smartfmt::TextStructureView &view, const FormatStyle &style,
      const smartfmt::SyntaxToken &token,
      const smartfmt::FormattingRuleChain &rules,
      const smartfmt::CancellationToken &cancel) const;

  // FormatRange(), then FormatToken() if that gave no edits.
  absl::StatusOr<Edits> FormatRangeOrToken(
      const smartfmt::TextStructureView &view, const FormatStyle &style,
      const smartfmt::SyntaxToken &token,
      const smartfmt::FormattingRuleChain &rules,
      const smartfmt::CancellationToken &cancel) const;

  // Formats 'span' widened to whole lines.
  absl::StatusOr<Edits> FormatSpan(
      const smartfmt::TextStructureView &view, const FormatStyle &style,
      smartfmt::Interval<int> span, const smartfmt::FormattingRuleChain &rules,
      const smartfmt::CancellationToken &cancel) const;

  const EditorFormattingServices services_;
};

// Returns the token that ends before 'caret': the token containing
// 'caret - 1', or the closest one before it if that is trivia.
// The missing token if there is none.
smartfmt::SyntaxToken LocateTokenBeforeCaret(
    const smartfmt::TextStructureView &view, int caret);

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_EDITOR_FORMATTING_SERVICE_H_
