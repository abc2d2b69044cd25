#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pulsar_mcp {

// 0-indexed buffer position. Columns count bytes within the line.
struct Position {
    int row = 0;
    int column = 0;

    bool operator==(const Position& o) const { return row == o.row && column == o.column; }
    bool operator!=(const Position& o) const { return !(*this == o); }
    bool operator<(const Position& o) const {
        return row < o.row || (row == o.row && column < o.column);
    }
};

struct Range {
    Position start;
    Position end;

    [[nodiscard]] bool IsEmpty() const { return start == end; }
    /// start <= end.
    [[nodiscard]] Range Normalized() const;
};

// -- Buffer arithmetic -------------------------------------------------------

/// Byte offset of the first character of every line. Always non-empty.
std::vector<std::size_t> LineStarts(std::string_view text);

/// Clamp row to the last line and column to the line length.
Position ClampPosition(std::string_view text, Position pos);

std::size_t OffsetOf(std::string_view text, Position pos);

Position PositionAt(std::string_view text, std::size_t offset);

/// Position just past the last character.
Position EndOfText(std::string_view text);

/// Number of lines; an empty buffer has one.
int LineCount(std::string_view text);

std::string TextInRange(std::string_view text, const Range& range);

// -- JSON --------------------------------------------------------------------

nlohmann::json ToJson(const Position& pos);
nlohmann::json ToJson(const Range& range);

/// Floor a JSON number to an int coordinate. Throws std::invalid_argument
/// for a non-number, a non-finite value or one outside the int range.
int CoordinateFromJson(const nlohmann::json& value, const std::string& name);

/// Parse {row, column}. Throws std::invalid_argument when malformed.
Position PositionFromJson(const nlohmann::json& value, const std::string& name);

} // namespace pulsar_mcp
