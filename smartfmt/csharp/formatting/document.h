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

// The document snapshot that editor formatting reads, and the host hook
// that contributes rules for it.

#ifndef SMARTFMT_CSHARP_FORMATTING_DOCUMENT_H_
#define SMARTFMT_CSHARP_FORMATTING_DOCUMENT_H_

#include <memory>
#include <utility>

#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/csharp/formatting/format-style.h"

namespace csharp {
namespace formatter {

// Immutable snapshot of a document: its parsed text and active options.
// Either may be unavailable (e.g. still being parsed), reported as
// absl::UnavailableError.
class Document {
 public:
  virtual ~Document() = default;

  // The returned view lives as long as this document.
  virtual absl::StatusOr<const smartfmt::TextStructureView *> GetSyntaxTree()
      const = 0;

  virtual absl::StatusOr<FormatStyle> GetOptions() const = 0;
};

// Document over an owned text structure.
class SnapshotDocument : public Document {
 public:
  // A null 'text' makes the syntax tree unavailable.
  SnapshotDocument(std::unique_ptr<smartfmt::TextStructure> text,
                   const FormatStyle &style)
      : text_(std::move(text)), style_(style) {}

  absl::StatusOr<const smartfmt::TextStructureView *> GetSyntaxTree()
      const final;

  absl::StatusOr<FormatStyle> GetOptions() const final;

 private:
  const std::unique_ptr<smartfmt::TextStructure> text_;

  const FormatStyle style_;
};

// Supplies rules that depend on where a document is hosted, e.g. code
// embedded in another language.  Host rules precede the default rules.
class HostRuleFactory {
 public:
  virtual ~HostRuleFactory() = default;

  virtual smartfmt::FormattingRuleChain CreateRules(const Document &document,
                                                    int position) const = 0;
};

// For documents that are hosted on their own.
class NoHostRuleFactory : public HostRuleFactory {
 public:
  smartfmt::FormattingRuleChain CreateRules(const Document &document,
                                            int position) const final {
    return {};
  }
};

// For code embedded at a fixed indentation inside a host document.
class BaseIndentationRuleFactory : public HostRuleFactory {
 public:
  explicit BaseIndentationRuleFactory(int base_indentation)
      : base_indentation_(base_indentation) {}

  smartfmt::FormattingRuleChain CreateRules(const Document &document,
                                            int position) const final;

 private:
  const int base_indentation_;
};

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_DOCUMENT_H_
