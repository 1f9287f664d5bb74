#ifndef BT_REGEX_HPP
#define BT_REGEX_HPP

#include <bt_cxx_std.hpp>
#include <bt_types.hpp>
#include <bt_error.hpp>

/** @brief namespace BtRegex */
namespace BtRegex {
enum class NodeType : st32; // Pattern tree node variants
struct Node;                // Pattern tree node
struct CaptureGroup;        // Capture slot span
class CaptureCheckpoint;    // Scoped save/restore of one capture slot
class Continuation;         // "Rest of the match" callback
class Parser;               // Pattern string to pattern tree
class Matcher;              // Backtracking search over a pattern tree
class Regex;                // Compiled pattern facade

/** @brief Slot number to captured text. Slot 0 is the whole match. */
using CaptureTable = std::map<st32, std::string>;

std::string format_captures(const CaptureTable &table);
}; // namespace BtRegex

/**
 * @name Node type enumeration
 * @brief The closed set of pattern tree variants.
 * @details
 * Each variant maps to one construct of the pattern grammar. The matcher
 * switches on this tag; there is no node class hierarchy.
 */
enum class BtRegex::NodeType : st32 {
  NODE_LITERAL = 0, // Exactly one character
  NODE_SEQUENCE,    // Children matched one after another
  NODE_ALTERNATION, // First child that leads to success
  NODE_STAR,        // Zero or more repetitions of the single child
  NODE_GROUP        // Single child, span recorded under captureIndex
};

namespace BtRegex {
/**
 * @brief Pattern tree node
 * @details
 * Immutable once the parser returns it. Every node owns its children, so the
 * root owns the whole tree. NODE_STAR and NODE_GROUP always have exactly one
 * child; NODE_SEQUENCE may have none (the empty match).
 */
struct Node {
  NodeType type;                               // Variant tag
  st32 c = 0;                                  // Code point for NODE_LITERAL
  std::string text;                            // Its UTF-8 bytes
  st32 captureIndex = BT_NPOS;                 // Slot for NODE_GROUP
  std::vector<std::unique_ptr<Node>> children; // Owned sub-nodes

  explicit Node(NodeType t, st32 ch = 0);

  static std::unique_ptr<Node> literal(st32 codepoint, std::string bytes);
  static std::unique_ptr<Node>
  sequence(std::vector<std::unique_ptr<Node>> items);
  static std::unique_ptr<Node>
  alternation(std::vector<std::unique_ptr<Node>> branches);
  static std::unique_ptr<Node> star(std::unique_ptr<Node> inner);
  static std::unique_ptr<Node> group(st32 index, std::unique_ptr<Node> inner);

  const Node &inner() const;             // Child of NODE_STAR / NODE_GROUP
  st32 max_capture_index() const;        // Highest group index, 0 if none
  bool equals(const Node &other) const;  // Structural equality
  std::string to_pattern() const;        // Render back to pattern syntax
};

/**
 * @brief Span of one capture slot, BT_NPOS when unset
 */
struct CaptureGroup {
  st32 start_pos = BT_NPOS; // Starting position
  st32 end_pos = BT_NPOS;   // Ending position (exclusive)

  bool is_set() const { return start_pos != BT_NPOS; }
};

/**
 * @brief Remembers a slot's value and puts it back unless kept
 */
class CaptureCheckpoint {
private:
  CaptureGroup &slot_;
  CaptureGroup saved_;
  bool keep_ = false;

public:
  explicit CaptureCheckpoint(CaptureGroup &slot);
  ~CaptureCheckpoint();

  CaptureCheckpoint(const CaptureCheckpoint &) = delete;
  CaptureCheckpoint &operator=(const CaptureCheckpoint &) = delete;

  void keep(); // Derivation succeeded, leave the new value in place
};

/**
 * @brief What to do with the rest of the input
 * @details
 * Invoked once per candidate end position of the node being matched.
 * Returns true as soon as the whole remaining derivation succeeds.
 */
class Continuation {
public:
  virtual ~Continuation() = default;
  virtual bool resume(st32 pos) = 0;
};

/**
 * @brief Recursive descent parser from pattern string to pattern tree
 */
class Parser {
private:
  std::string pattern_;          // Pattern being parsed
  size_t pos_ = 0;               // Next unread byte
  st32 next_capture_index_ = 1;  // Counter for capture groups

  bool atEnd() const;
  char peek() const;
  st32 readCharacter(std::string &bytes); // One UTF-8 encoded character
  std::unique_ptr<Node> parseExpression(); // term ('|' term)*
  std::unique_ptr<Node> parseTerm();       // factor*
  std::unique_ptr<Node> parseFactor();     // atom '*'?
  std::unique_ptr<Node> parseAtom();       // literal | '(' expression ')'

public:
  Parser();

  std::unique_ptr<Node> parse(const std::string &pattern); // Build tree
  st32 get_capture_count() const; // Groups created by the last parse
};

/**
 * @brief Backtracking matcher for one match attempt
 * @details
 * Holds the working capture storage, so a Matcher must not be shared
 * between threads. The tree it borrows may be.
 */
class Matcher {
private:
  struct AcceptContinuation;
  struct SequenceContinuation;
  struct StarContinuation;
  struct GroupContinuation;

  const Node *root_;                // Tree root (non-owning)
  const std::string *input_;        // Input of the current attempt
  st32 num_capture_groups_;         // Number of capture groups
  std::vector<CaptureGroup> slots_; // Search state, indexed by group
  CaptureTable captures_;           // Result of the last successful match

  bool matchNode(const Node *n, st32 pos, Continuation &k);
  bool matchSequence(const Node *n, size_t from, st32 pos, Continuation &k);
  bool matchStar(const Node *n, st32 pos, Continuation &k);

public:
  // Slots are sized to cover every group in the tree, even when numCaptures
  // is smaller.
  Matcher(BT_BORROW BT_NONNULL const Node *root, st32 numCaptures);

  bool match(const std::string &s);          // Whole-string match
  bool has_capture(st32 index) const;        // Slot populated?
  std::string get_capture(st32 index) const; // Captured text or ""
  const CaptureTable &captures() const;      // All populated slots
};

/**
 * @brief A compiled pattern
 * @details
 * Immutable after from_str. Each match_str call searches with its own
 * Matcher, so one Regex may be matched from several threads at once.
 */
class Regex {
private:
  std::string pattern_;
  std::unique_ptr<Node> root_;
  st32 capture_count_;

  Regex(std::string pattern, std::unique_ptr<Node> root, st32 captureCount);

public:
  static Regex from_str(const std::string &pattern); // Throws SyntaxError

  std::optional<CaptureTable> match_str(const std::string &input) const;

  const std::string &pattern() const;
  st32 capture_count() const;
  const Node &root() const;
  std::string debug() const;
};

} // namespace BtRegex

#endif // BT_REGEX_HPP
