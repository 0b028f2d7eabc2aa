#include "tag_scanner.hpp"

#include <utility>

namespace toolseek {

TagScanner::TagScanner(std::vector<std::string> paired_tags, std::vector<std::string> markers) {
  for (const auto& name : paired_tags) {
    if (name.empty()) continue;
    tokens_.push_back({"<" + name + ">", SegmentKind::kOpenTag, name});
    tokens_.push_back({"</" + name + ">", SegmentKind::kCloseTag, name});
  }
  for (auto& marker : markers) {
    if (marker.empty()) continue;
    tokens_.push_back({std::move(marker), SegmentKind::kMarker, std::string()});
  }
  for (const auto& t : tokens_) {
    if (first_chars_.find(t.text.front()) == std::string::npos) first_chars_.push_back(t.text.front());
  }
}

TagScanner TagScanner::ForReasoning() {
  return TagScanner({kCodeTag, kOutputTag}, {kEndOfReasoningMarker});
}

std::vector<ScanSegment> TagScanner::Feed(const std::string& chunk) {
  std::vector<ScanSegment> out;
  if (chunk.empty()) return out;
  pending_ += chunk;
  Scan(&out);
  return out;
}

std::vector<ScanSegment> TagScanner::Finish() {
  std::vector<ScanSegment> out;
  EmitText(std::move(pending_), &out);
  pending_.clear();
  return out;
}

bool TagScanner::Recognizes(const Token& token) const {
  if (region_.empty()) return true;
  return token.kind == SegmentKind::kCloseTag && token.name == region_;
}

void TagScanner::EmitText(std::string text, std::vector<ScanSegment>* out) {
  if (text.empty()) return;
  ScanSegment seg;
  seg.kind = SegmentKind::kText;
  seg.text = std::move(text);
  seg.region = region_;
  out->push_back(std::move(seg));
}

void TagScanner::Scan(std::vector<ScanSegment>* out) {
  size_t start = 0;
  size_t pos = 0;
  while (true) {
    const size_t i = pending_.find_first_of(first_chars_, pos);
    if (i == std::string::npos) {
      EmitText(pending_.substr(start), out);
      pending_.clear();
      return;
    }

    const size_t avail = pending_.size() - i;
    const Token* match = nullptr;
    bool partial = false;
    for (const auto& t : tokens_) {
      if (!Recognizes(t)) continue;
      if (avail >= t.text.size()) {
        if (pending_.compare(i, t.text.size(), t.text) == 0) {
          match = &t;
          break;
        }
      } else if (t.text.compare(0, avail, pending_, i, avail) == 0) {
        partial = true;
      }
    }

    if (match) {
      EmitText(pending_.substr(start, i - start), out);
      ScanSegment seg;
      seg.kind = match->kind;
      seg.text = match->text;
      seg.region = match->name;
      if (match->kind == SegmentKind::kOpenTag) {
        region_ = match->name;
      } else if (match->kind == SegmentKind::kCloseTag) {
        region_.clear();
      }
      out->push_back(std::move(seg));
      start = pos = i + match->text.size();
      continue;
    }

    if (partial) {
      // Everything from i on could still become a token.
      EmitText(pending_.substr(start, i - start), out);
      pending_.erase(0, i);
      return;
    }
    pos = i + 1;
  }
}

std::vector<ScanSegment> CoalesceSegments(const std::vector<ScanSegment>& segments) {
  std::vector<ScanSegment> out;
  for (const auto& seg : segments) {
    if (seg.kind == SegmentKind::kText && !out.empty() && out.back().kind == SegmentKind::kText &&
        out.back().region == seg.region) {
      out.back().text += seg.text;
      continue;
    }
    out.push_back(seg);
  }
  return out;
}

}  // namespace toolseek
