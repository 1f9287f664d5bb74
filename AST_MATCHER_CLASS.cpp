#include "REGEX.hpp"

typedef BtRegex::Node Node;
typedef BtRegex::NodeType NodeType;
typedef BtRegex::CaptureGroup CaptureGroup;
typedef BtRegex::CaptureCheckpoint CaptureCheckpoint;
typedef BtRegex::CaptureTable CaptureTable;
typedef BtRegex::Continuation Continuation;
typedef BtRegex::Matcher Matcher;

/* ========== Continuations ========== */

// End of the whole pattern: only the end of the input is acceptable.
struct Matcher::AcceptContinuation : Continuation {
  st32 end;

  explicit AcceptContinuation(st32 e) : end(e) {}

  bool resume(st32 pos) override { return pos == end; }
};

// Remaining items of a sequence, then k.
struct Matcher::SequenceContinuation : Continuation {
  Matcher &m;
  const Node *seq;
  size_t next;
  Continuation &k;

  SequenceContinuation(Matcher &matcher, const Node *n, size_t from,
                       Continuation &outer)
      : m(matcher), seq(n), next(from), k(outer) {}

  bool resume(st32 pos) override {
    return m.matchSequence(seq, next, pos, k);
  }
};

// After one iteration of a star: iterate again, unless it was zero-width.
struct Matcher::StarContinuation : Continuation {
  Matcher &m;
  const Node *star;
  st32 start;
  Continuation &k;

  StarContinuation(Matcher &matcher, const Node *n, st32 from,
                   Continuation &outer)
      : m(matcher), star(n), start(from), k(outer) {}

  bool resume(st32 pos) override {
    // No progress: this was the last iteration, never recurse at pos again.
    if (pos == start)
      return k.resume(pos);
    return m.matchStar(star, pos, k);
  }
};

// Group body reached pos: record the span for everything downstream.
struct Matcher::GroupContinuation : Continuation {
  Matcher &m;
  st32 index;
  st32 start;
  Continuation &k;

  GroupContinuation(Matcher &matcher, st32 idx, st32 from, Continuation &outer)
      : m(matcher), index(idx), start(from), k(outer) {}

  bool resume(st32 pos) override {
    CaptureCheckpoint checkpoint(m.slots_[index]);
    m.slots_[index].start_pos = start;
    m.slots_[index].end_pos = pos;

    if (k.resume(pos)) {
      checkpoint.keep();
      return true;
    }
    return false;
  }
};

/* ========== Matcher Implementation ========== */

Matcher::Matcher(const Node *root, st32 numCaptures)
    : root_(root), input_(nullptr),
      num_capture_groups_(std::max(numCaptures, root->max_capture_index())) {}

bool Matcher::matchNode(const Node *n, st32 pos, Continuation &k) {
  switch (n->type) {
  case NodeType::NODE_LITERAL: {
    // All bytes of the character, so a match never ends mid-sequence.
    const size_t len = n->text.length();
    if (static_cast<size_t>(pos) + len <= input_->length() &&
        input_->compare(static_cast<size_t>(pos), len, n->text) == 0) {
      return k.resume(pos + static_cast<st32>(len));
    }
    return false;
  }

  case NodeType::NODE_SEQUENCE:
    return matchSequence(n, 0, pos, k);

  case NodeType::NODE_ALTERNATION:
    // Left to right; the first branch that completes the match wins.
    for (const auto &branch : n->children) {
      if (matchNode(branch.get(), pos, k))
        return true;
    }
    return false;

  case NodeType::NODE_STAR:
    return matchStar(n, pos, k);

  case NodeType::NODE_GROUP: {
    GroupContinuation next(*this, n->captureIndex, pos, k);
    return matchNode(&n->inner(), pos, next);
  }
  }
  return false;
}

bool Matcher::matchSequence(const Node *n, size_t from, st32 pos,
                            Continuation &k) {
  if (from == n->children.size())
    return k.resume(pos);

  SequenceContinuation next(*this, n, from + 1, k);
  return matchNode(n->children[from].get(), pos, next);
}

bool Matcher::matchStar(const Node *n, st32 pos, Continuation &k) {
  // Greedy: one more iteration first, then zero more.
  StarContinuation next(*this, n, pos, k);
  if (matchNode(&n->inner(), pos, next))
    return true;
  return k.resume(pos);
}

bool Matcher::match(const std::string &s) {
  input_ = &s;
  captures_.clear();
  slots_.assign(static_cast<size_t>(num_capture_groups_) + 1, CaptureGroup());

  AcceptContinuation accept(static_cast<st32>(s.length()));
  bool result = matchNode(root_, 0, accept);

  if (result) {
    captures_[0] = s;
    for (st32 i = 1; i <= num_capture_groups_; i++) {
      const CaptureGroup &slot = slots_[i];
      if (slot.is_set()) {
        captures_[i] = s.substr(slot.start_pos, slot.end_pos - slot.start_pos);
      }
    }
  }

  input_ = nullptr;
  return result;
}

bool Matcher::has_capture(st32 index) const {
  return captures_.find(index) != captures_.end();
}

std::string Matcher::get_capture(st32 index) const {
  auto it = captures_.find(index);
  if (it != captures_.end()) {
    return it->second;
  }
  return "";
}

const CaptureTable &Matcher::captures() const { return captures_; }
