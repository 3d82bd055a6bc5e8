// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_SCENE_RICH_TEXT_H_
#define BOARDKIT_SCENE_RICH_TEXT_H_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "scene/scene_object.h"

namespace boardkit {
namespace internal {

// Offsets below are UTF-8 byte offsets into the concatenated run text.

/// Drop empty runs and merge adjacent runs whose styles are equal.
std::vector<TextRun> NormalizeRuns(std::vector<TextRun> runs);

/// Concatenation of every run's text.
std::string PlainText(const std::vector<TextRun>& runs);

size_t TextLength(const std::vector<TextRun>& runs);

/// Insert text with the given style at offset (clamped to the length).
std::vector<TextRun> InsertText(const std::vector<TextRun>& runs,
                                size_t offset, const std::string& text,
                                const TextStyle& style);

/// Remove the byte range [begin, end).
std::vector<TextRun> EraseText(const std::vector<TextRun>& runs, size_t begin,
                               size_t end);

/// Restyle the byte range [begin, end) through mutator.
std::vector<TextRun> ApplyStyle(const std::vector<TextRun>& runs, size_t begin,
                                size_t end,
                                const std::function<void(TextStyle*)>& mutator);

/// Style in effect just before offset, or fallback for an empty array.
TextStyle StyleAt(const std::vector<TextRun>& runs, size_t offset,
                  const TextStyle& fallback);

/// Every run must have a positive font size and a non-empty family.
bool ValidateRuns(const std::vector<TextRun>& runs);

/// Convert flat legacy fields into a single run. Returns true if the body
/// changed. Bodies that already carry content only lose the stale legacy
/// record; calling this again is a no-op.
bool MigrateLegacyText(TextBody* body);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_SCENE_RICH_TEXT_H_
