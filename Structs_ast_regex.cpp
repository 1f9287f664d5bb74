#include "REGEX.hpp"

typedef BtRegex::Node Node;
typedef BtRegex::NodeType NodeType;
typedef BtRegex::CaptureCheckpoint CaptureCheckpoint;

/* ========== Node Implementation ========== */

Node::Node(NodeType t, st32 ch) : type(t), c(ch) {}

std::unique_ptr<Node> Node::literal(st32 codepoint, std::string bytes) {
  auto n = std::make_unique<Node>(NodeType::NODE_LITERAL, codepoint);
  n->text = std::move(bytes);
  return n;
}

std::unique_ptr<Node> Node::sequence(std::vector<std::unique_ptr<Node>> items) {
  auto n = std::make_unique<Node>(NodeType::NODE_SEQUENCE);
  n->children = std::move(items);
  return n;
}

std::unique_ptr<Node>
Node::alternation(std::vector<std::unique_ptr<Node>> branches) {
  auto n = std::make_unique<Node>(NodeType::NODE_ALTERNATION);
  n->children = std::move(branches);
  return n;
}

std::unique_ptr<Node> Node::star(std::unique_ptr<Node> inner) {
  auto n = std::make_unique<Node>(NodeType::NODE_STAR);
  n->children.push_back(std::move(inner));
  return n;
}

std::unique_ptr<Node> Node::group(st32 index, std::unique_ptr<Node> inner) {
  auto n = std::make_unique<Node>(NodeType::NODE_GROUP);
  n->captureIndex = index;
  n->children.push_back(std::move(inner));
  return n;
}

const Node &Node::inner() const { return *children.front(); }

st32 Node::max_capture_index() const {
  st32 highest = type == NodeType::NODE_GROUP ? captureIndex : 0;
  for (const auto &child : children)
    highest = std::max(highest, child->max_capture_index());
  return highest;
}

bool Node::equals(const Node &other) const {
  if (type != other.type || c != other.c || text != other.text ||
      captureIndex != other.captureIndex ||
      children.size() != other.children.size())
    return false;
  for (size_t i = 0; i < children.size(); i++) {
    if (!children[i]->equals(*other.children[i]))
      return false;
  }
  return true;
}

std::string Node::to_pattern() const {
  std::string s;
  switch (type) {
  case NodeType::NODE_LITERAL:
    s = text;
    break;
  case NodeType::NODE_SEQUENCE:
    for (const auto &item : children)
      s += item->to_pattern();
    break;
  case NodeType::NODE_ALTERNATION:
    for (size_t i = 0; i < children.size(); i++) {
      if (i > 0)
        s.push_back('|');
      s += children[i]->to_pattern();
    }
    break;
  case NodeType::NODE_STAR:
    s = inner().to_pattern() + "*";
    break;
  case NodeType::NODE_GROUP:
    s = "(" + inner().to_pattern() + ")";
    break;
  }
  return s;
}

/* ========== CaptureCheckpoint Implementation ========== */

CaptureCheckpoint::CaptureCheckpoint(BtRegex::CaptureGroup &slot)
    : slot_(slot), saved_(slot) {}

CaptureCheckpoint::~CaptureCheckpoint() {
  if (!keep_)
    slot_ = saved_;
}

void CaptureCheckpoint::keep() { keep_ = true; }
