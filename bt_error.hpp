#ifndef BT_ERROR_HPP
#define BT_ERROR_HPP
#include <bt_cxx_std.hpp>
#include <bt_types.hpp>

namespace BtError {
enum class BtErrorType;
class SyntaxError;
[[noreturn]] inline void report_error(BtErrorType type,
                                      const std::string &message, st32 pos);
}; // namespace BtError

enum class BtError::BtErrorType {
  BT_NO_ERROR = 0,
  BT_UNMATCHED_OPEN_PAREN,  // '(' never closed
  BT_UNMATCHED_CLOSE_PAREN, // ')' without an opening '('
  BT_DANGLING_STAR,         // '*' with no atom to repeat
  BT_INVALID_UTF8,          // Byte sequence that is not a UTF-8 character
};

/**
 * @brief Pattern compilation failure
 * @details
 * Raised only while parsing. Carries the error code and the 0-based byte
 * offset into the pattern that triggered it.
 */
class BtError::SyntaxError : public std::runtime_error {
private:
  BtErrorType type_;
  st32 pos_;

public:
  SyntaxError(BtErrorType type, const std::string &what, st32 pos)
      : std::runtime_error(what), type_(type), pos_(pos) {}

  BtErrorType type() const { return type_; }
  st32 position() const { return pos_; }
};

inline void BtError::report_error(BtErrorType type, const std::string &message,
                                  st32 pos) {
  throw SyntaxError(type,
                    "BtError " + message + " at position " +
                        std::to_string(pos) + " (Code: " +
                        std::to_string(static_cast<int>(type)) + ")",
                    pos);
}

#endif // BT_ERROR_HPP
