#include "REGEX.hpp"

typedef BtRegex::Node Node;
typedef BtRegex::Parser Parser;
typedef BtError::BtErrorType BtErrorType;

// Parser implementation
Parser::Parser() {}

bool Parser::atEnd() const { return pos_ >= pattern_.length(); }

char Parser::peek() const { return pattern_[pos_]; }

// Consumes one whole UTF-8 character into bytes and returns its code point.
// Overlong forms, surrogates and truncated sequences are rejected.
st32 Parser::readCharacter(std::string &bytes) {
  const st32 start = static_cast<st32>(pos_);
  const ut8 lead = static_cast<ut8>(peek());
  size_t len = 0;
  st32 cp = 0;
  ut8 lo = 0x80, hi = 0xBF; // Allowed range of the first continuation byte

  if (lead < 0x80) {
    len = 1;
    cp = lead;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
    cp = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    cp = lead & 0x0F;
    if (lead == 0xE0)
      lo = 0xA0;
    else if (lead == 0xED)
      hi = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    cp = lead & 0x07;
    if (lead == 0xF0)
      lo = 0x90;
    else if (lead == 0xF4)
      hi = 0x8F;
  } else {
    BtError::report_error(BtErrorType::BT_INVALID_UTF8,
                          "Syntax error. Invalid UTF-8 lead byte", start);
  }

  for (size_t i = 1; i < len; i++) {
    if (pos_ + i >= pattern_.length()) {
      BtError::report_error(BtErrorType::BT_INVALID_UTF8,
                            "Syntax error. Truncated UTF-8 character", start);
    }
    const ut8 cont = static_cast<ut8>(pattern_[pos_ + i]);
    if (cont < (i == 1 ? lo : 0x80) || cont > (i == 1 ? hi : 0xBF)) {
      BtError::report_error(BtErrorType::BT_INVALID_UTF8,
                            "Syntax error. Invalid UTF-8 continuation byte",
                            start);
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  bytes = pattern_.substr(pos_, len);
  pos_ += len;
  return cp;
}

std::unique_ptr<Node> Parser::parse(const std::string &pattern) {
  pattern_ = pattern;
  pos_ = 0;
  next_capture_index_ = 1;

  std::unique_ptr<Node> root = parseExpression();

  // parseExpression only stops early on a ')' it has no group for.
  if (!atEnd()) {
    BtError::report_error(BtErrorType::BT_UNMATCHED_CLOSE_PAREN,
                          "Syntax error. Extra ')'",
                          static_cast<st32>(pos_));
  }
  return root;
}

std::unique_ptr<Node> Parser::parseExpression() {
  std::vector<std::unique_ptr<Node>> branches;
  branches.push_back(parseTerm());

  while (!atEnd() && peek() == '|') {
    pos_++;
    branches.push_back(parseTerm());
  }

  if (branches.size() == 1)
    return std::move(branches.front());
  return Node::alternation(std::move(branches));
}

std::unique_ptr<Node> Parser::parseTerm() {
  std::vector<std::unique_ptr<Node>> items;

  while (!atEnd() && peek() != '|' && peek() != ')') {
    items.push_back(parseFactor());
  }

  if (items.size() == 1)
    return std::move(items.front());
  return Node::sequence(std::move(items));
}

std::unique_ptr<Node> Parser::parseFactor() {
  std::unique_ptr<Node> atom = parseAtom();

  if (!atEnd() && peek() == '*') {
    pos_++;
    return Node::star(std::move(atom));
  }
  return atom;
}

std::unique_ptr<Node> Parser::parseAtom() {
  const st32 start = static_cast<st32>(pos_);
  const char ch = peek();

  switch (ch) {
  case '*': // Nothing before it in this term to repeat
    BtError::report_error(BtErrorType::BT_DANGLING_STAR,
                          "Syntax error. * requires a preceding atom", start);
  case '(': {
    // Number the group before descending so outer groups come first.
    st32 capIndex = next_capture_index_++;
    pos_++;
    std::unique_ptr<Node> inner = parseExpression();
    if (atEnd()) {
      BtError::report_error(BtErrorType::BT_UNMATCHED_OPEN_PAREN,
                            "Syntax error. Missing ')'", start);
    }
    pos_++; // ')'
    return Node::group(capIndex, std::move(inner));
  }
  default: { // Literal character, possibly several bytes long
    std::string bytes;
    st32 cp = readCharacter(bytes);
    return Node::literal(cp, std::move(bytes));
  }
  }
}

st32 Parser::get_capture_count() const { return next_capture_index_ - 1; }
