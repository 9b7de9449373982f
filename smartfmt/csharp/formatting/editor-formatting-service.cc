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

#include "smartfmt/csharp/formatting/editor-formatting-service.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/basic-layout-engine.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/strings/line-column-map.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/common/util/interval.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/common/util/status-macros.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/analysis/syntax-facts.h"
#include "smartfmt/csharp/formatting/document.h"
#include "smartfmt/csharp/formatting/format-style.h"
#include "smartfmt/csharp/formatting/formatting-range-helper.h"
#include "smartfmt/csharp/formatting/formatting-rules.h"
#include "smartfmt/csharp/formatting/token-filters.h"

namespace csharp {
namespace formatter {

using smartfmt::CancellationToken;
using smartfmt::FormattingRuleChain;
using smartfmt::Interval;
using smartfmt::SyntaxToken;
using smartfmt::TextStructureView;

using Edits = EditorFormattingService::Edits;

namespace {
struct EventPrinter {
  std::ostream &stream;

  void operator()(const TypedCharacterEvent &e) const {
    stream << "typed '" << e.ch << "' @" << e.caret;
  }
  void operator()(const ReturnEvent &e) const {
    stream << "return @" << e.caret;
  }
  void operator()(const PasteEvent &e) const { stream << "paste " << e.span; }
  void operator()(const FormatRequestEvent &e) const {
    stream << "format ";
    if (e.span) {
      stream << *e.span;
    } else {
      stream << "document";
    }
  }
};
}  // namespace

std::ostream &operator<<(std::ostream &stream, const TriggerEvent &event) {
  std::visit(EventPrinter{stream}, event);
  return stream;
}

// Returns CANCELLED unchanged, and no edits for any other error.
static absl::StatusOr<Edits> NoEditsUnlessCancelled(const absl::Status &status,
                                                    std::string_view what) {
  if (absl::IsCancelled(status)) return status;
  if (absl::IsUnavailable(status)) {
    VLOG(1) << what << " unavailable: " << status.message();
  } else {
    LOG(WARNING) << what << " failed: " << status;
  }
  return Edits();
}

EditorFormattingServices DefaultCSharpServices() {
  EditorFormattingServices services;
  services.layout_engine = std::make_shared<smartfmt::BasicLayoutEngine>();
  services.range_resolver = std::make_shared<StructuralRangeResolver>();
  services.syntax_formatting =
      std::make_shared<CSharpSyntaxFormattingService>();
  return services;
}

EditorFormattingService::EditorFormattingService(
    EditorFormattingServices services)
    : services_(std::move(services)) {
  CHECK(services_.layout_engine != nullptr) << "Layout engine is required.";
  CHECK(services_.range_resolver != nullptr) << "Range resolver is required.";
}

SyntaxToken LocateTokenBeforeCaret(const TextStructureView &view, int caret) {
  const int position = std::max(0, caret - 1);
  const SyntaxToken token = view.FindToken(position, /*include_trivia=*/true);
  if (token.IsMissing() || view.StartOffset(token) >= caret) return {};
  return token;
}

bool EditorFormattingService::SupportsFormattingOnTypedCharacter(
    const Document &document, char ch) const {
  const auto style = document.GetOptions();
  if (!style.ok()) {
    VLOG(1) << "Options unavailable: " << style.status().message();
    return false;
  }
  return IsTriggerEnabled(ch, *style) && IsTriggerCharacter(ch);
}

absl::StatusOr<Edits> EditorFormattingService::Format(
    const Document &document, const TriggerEvent &event,
    const CancellationToken &cancel) const {
  VLOG(2) << "Format on " << event;
  struct Dispatcher {
    const EditorFormattingService &service;
    const Document &document;
    const CancellationToken &cancel;

    absl::StatusOr<Edits> operator()(const TypedCharacterEvent &e) const {
      return service.GetFormattingChangesOnTypedCharacter(document, e.ch,
                                                          e.caret, cancel);
    }
    absl::StatusOr<Edits> operator()(const ReturnEvent &e) const {
      return service.GetFormattingChangesOnReturn(document, e.caret, cancel);
    }
    absl::StatusOr<Edits> operator()(const PasteEvent &e) const {
      return service.GetFormattingChangesOnPaste(document, e.span, cancel);
    }
    absl::StatusOr<Edits> operator()(const FormatRequestEvent &e) const {
      return service.GetFormattingChanges(document, e.span, cancel);
    }
  };
  return std::visit(Dispatcher{*this, document, cancel}, event);
}

absl::StatusOr<FormattingRuleChain> EditorFormattingService::GetFormattingRules(
    const Document &document, int position) const {
  if (services_.syntax_formatting == nullptr) {
    return absl::UnavailableError("No syntax formatting service.");
  }
  FormattingRuleChain host_rules;
  if (services_.host_rules != nullptr) {
    host_rules = services_.host_rules->CreateRules(document, position);
  }
  return smartfmt::ConcatRuleChains(
      host_rules, services_.syntax_formatting->GetDefaultFormattingRules());
}

bool EditorFormattingService::IsInNonUserCode(const TextStructureView &view,
                                              const FormatStyle &style,
                                              int offset) const {
  if (services_.syntax_facts != nullptr) {
    return services_.syntax_facts->IsInNonUserCode(view, offset);
  }
  return CSharpSyntaxFacts(style.non_user_code_region)
      .IsInNonUserCode(view, offset);
}

absl::StatusOr<Edits> EditorFormattingService::FormatRange(
    const TextStructureView &view, const FormatStyle &style,
    const SyntaxToken &end_token, const FormattingRuleChain &rules,
    const CancellationToken &cancel) const {
  if (!IsEndToken(end_token)) return Edits();

  RETURN_IF_ERROR(cancel.Check());
  const std::optional<TokenRange> range =
      services_.range_resolver->FindAppropriateRange(view, end_token);
  if (!range.has_value() || range->start == range->end) {
    VLOG(2) << "No range ends with " << end_token;
    return Edits();
  }
  if (IsInvalidTokenKind(range->start) || IsInvalidTokenKind(range->end)) {
    VLOG(2) << "Invalid range bounds " << range->start << ", " << range->end;
    return Edits();
  }

  const Interval<int> span{view.StartOffset(range->start),
                           view.EndOffset(range->end)};
  VLOG(2) << "Formatting range " << span;
  RETURN_IF_ERROR(cancel.Check());
  auto edits = services_.layout_engine->ComputeEdits(view, {span}, rules,
                                                     style, cancel);
  if (!edits.ok()) return NoEditsUnlessCancelled(edits.status(), "Layout");
  return edits;
}

absl::StatusOr<Edits> EditorFormattingService::FormatToken(
    const TextStructureView &view, const FormatStyle &style,
    const SyntaxToken &token, const FormattingRuleChain &rules,
    const CancellationToken &cancel) const {
  VLOG(2) << "Formatting token " << token;
  RETURN_IF_ERROR(cancel.Check());
  auto edits = services_.layout_engine->ComputeTokenEdits(view, token, rules,
                                                          style, cancel);
  if (!edits.ok()) return NoEditsUnlessCancelled(edits.status(), "Layout");
  return edits;
}

absl::StatusOr<Edits> EditorFormattingService::FormatRangeOrToken(
    const TextStructureView &view, const FormatStyle &style,
    const SyntaxToken &token, const FormattingRuleChain &rules,
    const CancellationToken &cancel) const {
  auto edits = FormatRange(view, style, token, rules, cancel);
  if (!edits.ok() || !edits->empty()) return edits;
  // At least re-indent the token.
  return FormatToken(view, style, token, rules, cancel);
}

absl::StatusOr<Edits> EditorFormattingService::FormatSpan(
    const TextStructureView &view, const FormatStyle &style,
    Interval<int> span, const FormattingRuleChain &rules,
    const CancellationToken &cancel) const {
  const Interval<int> formatting_span = GetFormattingSpan(view, span);
  VLOG(2) << "Formatting span " << formatting_span;
  RETURN_IF_ERROR(cancel.Check());
  auto edits = services_.layout_engine->ComputeEdits(view, {formatting_span},
                                                     rules, style, cancel);
  if (!edits.ok()) return NoEditsUnlessCancelled(edits.status(), "Layout");
  return edits;
}

absl::StatusOr<Edits>
EditorFormattingService::GetFormattingChangesOnTypedCharacter(
    const Document &document, char ch, int caret,
    const CancellationToken &cancel) const {
  RETURN_IF_ERROR(cancel.Check());
  const auto view = document.GetSyntaxTree();
  if (!view.ok()) return NoEditsUnlessCancelled(view.status(), "Syntax tree");

  // First, find the token that was just typed.
  const SyntaxToken token = LocateTokenBeforeCaret(**view, caret);
  if (token.IsMissing()) {
    VLOG(1) << "No token before "
            << (*view)->GetLineColumnMap().GetLineColAtOffset(caret);
    return Edits();
  }
  if (!IsTriggerCharacter(ch)) {
    VLOG(1) << "Not a trigger character: '" << ch << "'";
    return Edits();
  }
  if (!MatchesTypedCharacter(ch, token) || IsInvalidTokenKind(token)) {
    VLOG(1) << token << " was not produced by typing '" << ch << "'";
    return Edits();
  }

  RETURN_IF_ERROR(cancel.Check());
  const auto style = document.GetOptions();
  if (!style.ok()) return NoEditsUnlessCancelled(style.status(), "Options");

  if (IsInNonUserCode(**view, *style, caret)) {
    VLOG(1) << "Caret "
            << (*view)->GetLineColumnMap().GetLineColAtOffset(caret)
            << " is in non-user code";
    return Edits();
  }
  if (ShouldNotFormatOnTypedCharacter(**view, token)) {
    VLOG(1) << "Context of " << token << " excludes formatting";
    return Edits();
  }

  const auto rules = GetFormattingRules(document, caret);
  if (!rules.ok()) return NoEditsUnlessCancelled(rules.status(), "Rules");

  // With close-brace formatting off, '}' is only smart-indented.
  if (token.Kind() == kCloseBraceToken && !style->auto_format_on_close_brace) {
    return FormatToken(**view, *style, token, *rules, cancel);
  }
  return FormatRangeOrToken(**view, *style, token, *rules, cancel);
}

absl::StatusOr<Edits> EditorFormattingService::GetFormattingChangesOnReturn(
    const Document &document, int caret,
    const CancellationToken &cancel) const {
  RETURN_IF_ERROR(cancel.Check());
  const auto view = document.GetSyntaxTree();
  if (!view.ok()) return NoEditsUnlessCancelled(view.status(), "Syntax tree");

  const SyntaxToken token = LocateTokenBeforeCaret(**view, caret);
  if (token.IsMissing()) {
    VLOG(1) << "No token before "
            << (*view)->GetLineColumnMap().GetLineColAtOffset(caret);
    return Edits();
  }
  if (IsInvalidSingleCharacterToken(token)) {
    VLOG(1) << "Invalid token for return: " << token;
    return Edits();
  }
  if (ShouldNotFormatOnReturn(token)) {
    VLOG(1) << "Return does not format after " << token;
    return Edits();
  }

  RETURN_IF_ERROR(cancel.Check());
  const auto style = document.GetOptions();
  if (!style.ok()) return NoEditsUnlessCancelled(style.status(), "Options");
  const auto rules = GetFormattingRules(document, caret);
  if (!rules.ok()) return NoEditsUnlessCancelled(rules.status(), "Rules");
  return FormatRangeOrToken(**view, *style, token, *rules, cancel);
}

absl::StatusOr<Edits> EditorFormattingService::GetFormattingChangesOnPaste(
    const Document &document, Interval<int> span,
    const CancellationToken &cancel) const {
  RETURN_IF_ERROR(cancel.Check());
  const auto view = document.GetSyntaxTree();
  if (!view.ok()) return NoEditsUnlessCancelled(view.status(), "Syntax tree");
  RETURN_IF_ERROR(cancel.Check());
  const auto style = document.GetOptions();
  if (!style.ok()) return NoEditsUnlessCancelled(style.status(), "Options");

  if (services_.syntax_formatting == nullptr) {
    VLOG(1) << "No syntax formatting service for paste";
    return Edits();
  }
  // Host rules do not apply to pasted code.
  const FormattingRuleChain rules = smartfmt::ConcatRuleChains(
      {std::make_shared<PasteFormattingRule>()},
      services_.syntax_formatting->GetDefaultFormattingRules());
  return FormatSpan(**view, *style, span, rules, cancel);
}

absl::StatusOr<Edits> EditorFormattingService::GetFormattingChanges(
    const Document &document, std::optional<Interval<int>> span,
    const CancellationToken &cancel) const {
  RETURN_IF_ERROR(cancel.Check());
  const auto view = document.GetSyntaxTree();
  if (!view.ok()) return NoEditsUnlessCancelled(view.status(), "Syntax tree");
  RETURN_IF_ERROR(cancel.Check());
  const auto style = document.GetOptions();
  if (!style.ok()) return NoEditsUnlessCancelled(style.status(), "Options");

  if (services_.syntax_formatting == nullptr) {
    VLOG(1) << "No syntax formatting service";
    return Edits();
  }
  const Interval<int> whole{
      0, static_cast<int>((*view)->Contents().length())};
  return FormatSpan(**view, *style, span.value_or(whole),
                    services_.syntax_formatting->GetDefaultFormattingRules(),
                    cancel);
}

}  // namespace formatter
}  // namespace csharp
