#pragma once

#include <string>
#include <vector>

namespace toolseek {

inline constexpr const char* kCodeTag = "python";
inline constexpr const char* kOutputTag = "output";
inline constexpr const char* kEndOfReasoningMarker = "</think>";
inline constexpr const char* kReasoningOpenMarker = "<think>";

enum class SegmentKind { kText, kOpenTag, kCloseTag, kMarker };

struct ScanSegment {
  SegmentKind kind = SegmentKind::kText;
  // Exact bytes consumed from the stream.
  std::string text;
  // kText: enclosing region ("" outside any region).
  // kOpenTag / kCloseTag: the tag name. kMarker: empty.
  std::string region;
};

// Incremental scanner over a stream of text that arrives in arbitrary
// pieces. Paired tags (<name> ... </name>) switch the current region; markers
// are standalone tokens that never change the region. Text that could still
// turn out to be the start of a token is held back until it is decided, so a
// token is never split across segments and the concatenation of all emitted
// segments plus Pending() always equals the input fed so far.
//
// While a region is open only its closing tag is recognized. No token may be
// a prefix of another.
class TagScanner {
 public:
  TagScanner(std::vector<std::string> paired_tags, std::vector<std::string> markers);

  // Scanner for <python>/<output> regions and the </think> marker.
  static TagScanner ForReasoning();

  std::vector<ScanSegment> Feed(const std::string& chunk);

  // Flushes whatever is held back as text of the current region. Never-closed
  // regions and partial tokens degrade to plain text here.
  std::vector<ScanSegment> Finish();

  const std::string& Region() const { return region_; }
  const std::string& Pending() const { return pending_; }

 private:
  struct Token {
    std::string text;
    SegmentKind kind;
    std::string name;
  };

  bool Recognizes(const Token& token) const;
  void Scan(std::vector<ScanSegment>* out);
  void EmitText(std::string text, std::vector<ScanSegment>* out);

  std::vector<Token> tokens_;
  std::string first_chars_;
  std::string pending_;
  std::string region_;
};

// Merges adjacent kText segments of the same region.
std::vector<ScanSegment> CoalesceSegments(const std::vector<ScanSegment>& segments);

}  // namespace toolseek
