#include <pulsar_mcp/editor/text_position.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pulsar_mcp {

Range Range::Normalized() const {
    if (end < start) {
        return {end, start};
    }
    return *this;
}

std::vector<std::size_t> LineStarts(std::string_view text) {
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            starts.push_back(i + 1);
        }
    }
    return starts;
}

namespace {

std::size_t LineLength(std::string_view text,
                       const std::vector<std::size_t>& starts, std::size_t row) {
    const auto begin = starts[row];
    const auto end = row + 1 < starts.size() ? starts[row + 1] - 1 : text.size();
    return end - begin;
}

} // anonymous namespace

Position ClampPosition(std::string_view text, Position pos) {
    const auto starts = LineStarts(text);
    const int last_row = static_cast<int>(starts.size()) - 1;
    Position out;
    out.row = std::clamp(pos.row, 0, last_row);
    const auto len = static_cast<int>(
        LineLength(text, starts, static_cast<std::size_t>(out.row)));
    out.column = std::clamp(pos.column, 0, len);
    return out;
}

std::size_t OffsetOf(std::string_view text, Position pos) {
    const auto clamped = ClampPosition(text, pos);
    const auto starts = LineStarts(text);
    return starts[static_cast<std::size_t>(clamped.row)] +
           static_cast<std::size_t>(clamped.column);
}

Position PositionAt(std::string_view text, std::size_t offset) {
    offset = std::min(offset, text.size());
    const auto starts = LineStarts(text);
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    const auto row = static_cast<std::size_t>(std::distance(starts.begin(), it)) - 1;
    return {static_cast<int>(row), static_cast<int>(offset - starts[row])};
}

Position EndOfText(std::string_view text) {
    return PositionAt(text, text.size());
}

int LineCount(std::string_view text) {
    return static_cast<int>(std::count(text.begin(), text.end(), '\n')) + 1;
}

std::string TextInRange(std::string_view text, const Range& range) {
    const auto r = range.Normalized();
    const auto begin = OffsetOf(text, r.start);
    const auto end = OffsetOf(text, r.end);
    if (end <= begin) return {};
    return std::string(text.substr(begin, end - begin));
}

nlohmann::json ToJson(const Position& pos) {
    return {{"row", pos.row}, {"column", pos.column}};
}

nlohmann::json ToJson(const Range& range) {
    return {{"start", ToJson(range.start)}, {"end", ToJson(range.end)}};
}

int CoordinateFromJson(const nlohmann::json& value, const std::string& name) {
    if (!value.is_number()) {
        throw std::invalid_argument(name + " must be a number");
    }
    const double floored = std::floor(value.get<double>());
    if (!std::isfinite(floored) ||
        floored < static_cast<double>(std::numeric_limits<int>::min()) ||
        floored > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(name + " is out of range");
    }
    return static_cast<int>(floored);
}

Position PositionFromJson(const nlohmann::json& value, const std::string& name) {
    if (!value.is_object() ||
        !value.contains("row") || !value["row"].is_number() ||
        !value.contains("column") || !value["column"].is_number()) {
        throw std::invalid_argument(name + " must be an object with numeric row and column");
    }
    return {CoordinateFromJson(value["row"], name + ".row"),
            CoordinateFromJson(value["column"], name + ".column")};
}

} // namespace pulsar_mcp
