// hh_outline/basic/pos.cpp - Absolute position encodings
#include "hh_outline/basic/pos.hpp"

#include <fmt/core.h>

namespace hh_outline
{

using nlohmann::json;

PosInfo info_pos(const AbsolutePos & pos) noexcept
{
  PosInfo info;
  if (pos.start_line == 0) {
    return info;
  }
  info.line = pos.start_line;
  info.char_start = pos.start_column;
  info.char_end = pos.end_byte - pos.start_line_offset();
  return info;
}

MultilinePosInfo multiline_info(const AbsolutePos & pos) noexcept
{
  MultilinePosInfo info;
  if (pos.start_line == 0) {
    return info;
  }
  info.line_start = pos.start_line;
  info.char_start = pos.start_column;
  info.line_end = pos.end_line;
  info.char_end = pos.end_column > 0 ? pos.end_column - 1 : 0;
  return info;
}

json pos_to_json(const AbsolutePos & pos)
{
  const PosInfo info = info_pos(pos);
  return json{
    {"filename", pos.file},
    {"line", info.line},
    {"char_start", info.char_start},
    {"char_end", info.char_end},
  };
}

json pos_to_multiline_json(const AbsolutePos & pos)
{
  const MultilinePosInfo info = multiline_info(pos);
  return json{
    {"filename", pos.file},       {"line_start", info.line_start}, {"char_start", info.char_start},
    {"line_end", info.line_end}, {"char_end", info.char_end},
  };
}

std::string pos_to_string(const AbsolutePos & pos)
{
  const PosInfo info = info_pos(pos);
  return fmt::format(
    "File \"{}\", line {}, characters {}-{}:", pos.file, info.line, info.char_start,
    info.char_end);
}

std::string pos_to_multiline_string(const AbsolutePos & pos)
{
  const MultilinePosInfo info = multiline_info(pos);
  return fmt::format(
    "File \"{}\", line {}, character {} - line {}, character {}:", pos.file, info.line_start,
    info.char_start, info.line_end, info.char_end);
}

}  // namespace hh_outline
