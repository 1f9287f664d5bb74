#include "REGEX.hpp"

typedef BtRegex::Node Node;
typedef BtRegex::Parser Parser;
typedef BtRegex::Matcher Matcher;
typedef BtRegex::Regex Regex;
typedef BtRegex::CaptureTable CaptureTable;

/* ========== Regex Implementation ========== */

Regex::Regex(std::string pattern, std::unique_ptr<Node> root,
             st32 captureCount)
    : pattern_(std::move(pattern)), root_(std::move(root)),
      capture_count_(captureCount) {}

Regex Regex::from_str(const std::string &pattern) {
  Parser parser;
  std::unique_ptr<Node> root = parser.parse(pattern);
  return Regex(pattern, std::move(root), parser.get_capture_count());
}

std::optional<CaptureTable> Regex::match_str(const std::string &input) const {
  Matcher matcher(root_.get(), capture_count_);
  if (!matcher.match(input))
    return std::nullopt;
  return matcher.captures();
}

const std::string &Regex::pattern() const { return pattern_; }

st32 Regex::capture_count() const { return capture_count_; }

const Node &Regex::root() const { return *root_; }

std::string Regex::debug() const { return root_->to_pattern(); }

/* ========== Capture table formatting ========== */

std::string BtRegex::format_captures(const CaptureTable &table) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &entry : table) {
    if (!first)
      out << ", ";
    first = false;
    out << entry.first << ": \"" << entry.second << "\"";
  }
  out << "}";
  return out.str();
}
