// hh_outline/basic/pos.hpp - Absolute positions and their output encodings
//
// An AbsolutePos is a SourceRange resolved against its SourceFile: it carries
// the file name and pre-computed line/column data so that it can be rendered
// without access to the source text.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace hh_outline
{

struct AbsolutePos
{
  std::string file;

  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  uint32_t start_line = 0;    ///< 1-indexed
  uint32_t start_column = 0;  ///< 1-indexed
  uint32_t end_line = 0;      ///< 1-indexed line of end_byte
  uint32_t end_column = 0;    ///< 1-indexed column of end_byte (exclusive end)

  /// Byte offset of the first character of start_line
  [[nodiscard]] uint32_t start_line_offset() const noexcept
  {
    return start_byte - (start_column - 1);
  }

  /// Whether `inner` lies entirely within this position (byte-wise).
  [[nodiscard]] bool contains(const AbsolutePos & inner) const noexcept
  {
    return inner.start_byte >= start_byte && inner.end_byte <= end_byte;
  }

  [[nodiscard]] bool operator==(const AbsolutePos & other) const noexcept
  {
    return file == other.file && start_byte == other.start_byte && end_byte == other.end_byte;
  }
  [[nodiscard]] bool operator!=(const AbsolutePos & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Single-line view of a position: (line, first column, last column).
struct PosInfo
{
  uint32_t line = 0;
  uint32_t char_start = 0;
  uint32_t char_end = 0;
};

/// Multi-line view of a position.
struct MultilinePosInfo
{
  uint32_t line_start = 0;
  uint32_t char_start = 0;
  uint32_t line_end = 0;
  uint32_t char_end = 0;
};

/**
 * Decompose a position into (line, char_start, char_end).
 *
 * `char_end` is measured from the beginning of the start line, so for a
 * single-line position it is the 1-indexed column of the last character.
 */
[[nodiscard]] PosInfo info_pos(const AbsolutePos & pos) noexcept;

[[nodiscard]] MultilinePosInfo multiline_info(const AbsolutePos & pos) noexcept;

/// {"filename", "line", "char_start", "char_end"}
[[nodiscard]] nlohmann::json pos_to_json(const AbsolutePos & pos);

/// {"filename", "line_start", "char_start", "line_end", "char_end"}
[[nodiscard]] nlohmann::json pos_to_multiline_json(const AbsolutePos & pos);

/// File "a.php", line 3, characters 10-12:
[[nodiscard]] std::string pos_to_string(const AbsolutePos & pos);

/// File "a.php", line 3, character 1 - line 9, character 1:
[[nodiscard]] std::string pos_to_multiline_string(const AbsolutePos & pos);

}  // namespace hh_outline
