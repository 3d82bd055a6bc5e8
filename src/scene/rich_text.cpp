// Copyright 2026 The boardkit Authors

#include "scene/rich_text.h"

#include <algorithm>
#include <utility>

namespace boardkit {
namespace internal {

namespace {

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Move offset back onto the start of a UTF-8 sequence.
size_t AlignToCodepoint(const std::vector<TextRun>& runs, size_t offset) {
  std::string text = PlainText(runs);
  offset = (std::min)(offset, text.size());
  while (offset > 0 && offset < text.size() && IsContinuationByte(text[offset]))
    --offset;
  return offset;
}

// Split runs so that a run boundary falls exactly at offset.
std::vector<TextRun> SplitAt(const std::vector<TextRun>& runs, size_t offset) {
  std::vector<TextRun> out;
  out.reserve(runs.size() + 1);
  size_t start = 0;
  for (const TextRun& run : runs) {
    size_t end = start + run.text.size();
    if (offset > start && offset < end) {
      size_t cut = offset - start;
      out.push_back({run.text.substr(0, cut), run.style});
      out.push_back({run.text.substr(cut), run.style});
    } else {
      out.push_back(run);
    }
    start = end;
  }
  return out;
}

}  // namespace

std::vector<TextRun> NormalizeRuns(std::vector<TextRun> runs) {
  std::vector<TextRun> out;
  out.reserve(runs.size());
  for (TextRun& run : runs) {
    if (run.text.empty()) continue;
    if (!out.empty() && out.back().style == run.style) {
      out.back().text += run.text;
    } else {
      out.push_back(std::move(run));
    }
  }
  return out;
}

std::string PlainText(const std::vector<TextRun>& runs) {
  std::string text;
  for (const TextRun& run : runs) text += run.text;
  return text;
}

size_t TextLength(const std::vector<TextRun>& runs) {
  size_t n = 0;
  for (const TextRun& run : runs) n += run.text.size();
  return n;
}

std::vector<TextRun> InsertText(const std::vector<TextRun>& runs,
                                size_t offset, const std::string& text,
                                const TextStyle& style) {
  offset = AlignToCodepoint(runs, offset);
  std::vector<TextRun> split = SplitAt(runs, offset);

  std::vector<TextRun> out;
  out.reserve(split.size() + 1);
  size_t start = 0;
  bool inserted = false;
  for (const TextRun& run : split) {
    if (!inserted && start == offset) {
      out.push_back({text, style});
      inserted = true;
    }
    out.push_back(run);
    start += run.text.size();
  }
  if (!inserted) out.push_back({text, style});
  return NormalizeRuns(std::move(out));
}

std::vector<TextRun> EraseText(const std::vector<TextRun>& runs, size_t begin,
                               size_t end) {
  begin = AlignToCodepoint(runs, begin);
  end = AlignToCodepoint(runs, end);
  if (begin >= end) return NormalizeRuns(runs);

  std::vector<TextRun> out;
  size_t start = 0;
  for (const TextRun& run : runs) {
    size_t run_end = start + run.text.size();
    size_t cut_begin = (std::max)(begin, start);
    size_t cut_end = (std::min)(end, run_end);
    TextRun kept = run;
    if (cut_begin < cut_end) {
      kept.text.erase(cut_begin - start, cut_end - cut_begin);
    }
    out.push_back(std::move(kept));
    start = run_end;
  }
  return NormalizeRuns(std::move(out));
}

std::vector<TextRun> ApplyStyle(
    const std::vector<TextRun>& runs, size_t begin, size_t end,
    const std::function<void(TextStyle*)>& mutator) {
  begin = AlignToCodepoint(runs, begin);
  end = AlignToCodepoint(runs, end);
  if (begin >= end || !mutator) return NormalizeRuns(runs);

  std::vector<TextRun> out = SplitAt(SplitAt(runs, begin), end);
  size_t start = 0;
  for (TextRun& run : out) {
    if (start >= begin && start + run.text.size() <= end) {
      mutator(&run.style);
    }
    start += run.text.size();
  }
  return NormalizeRuns(std::move(out));
}

TextStyle StyleAt(const std::vector<TextRun>& runs, size_t offset,
                  const TextStyle& fallback) {
  size_t start = 0;
  const TextRun* last = nullptr;
  for (const TextRun& run : runs) {
    if (run.text.empty()) continue;
    if (offset > start && offset <= start + run.text.size()) return run.style;
    start += run.text.size();
    last = &run;
  }
  if (offset == 0 && !runs.empty()) {
    for (const TextRun& run : runs) {
      if (!run.text.empty()) return run.style;
    }
  }
  return last ? last->style : fallback;
}

bool ValidateRuns(const std::vector<TextRun>& runs) {
  for (const TextRun& run : runs) {
    if (!(run.style.font_size > 0.0)) return false;
    if (run.style.font_family.empty()) return false;
  }
  return true;
}

bool MigrateLegacyText(TextBody* body) {
  if (!body || !body->legacy) return false;
  if (!body->content.empty()) {
    body->legacy.reset();
    return true;
  }

  const LegacyText& legacy = *body->legacy;
  TextStyle style;
  style.font_size = legacy.font_size > 0.0 ? legacy.font_size : 32.0;
  style.font_family = legacy.font_family.empty() ? "Arial" : legacy.font_family;
  style.font_weight = legacy.font_weight;
  style.color = legacy.color;

  if (!legacy.text.empty()) {
    body->content.push_back({legacy.text, style});
  }
  body->default_style = style;
  body->legacy.reset();
  return true;
}

}  // namespace internal
}  // namespace boardkit
