#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_probe {

// ---------------------------------------------------------------------------
// ContentShape - every way a conversation record can carry its text.
// ---------------------------------------------------------------------------
struct StringContent {
    std::string text;
};

struct ArrayContent {
    // One entry per array element; nullopt when the element has no string
    // `text` field (images, tool calls, ...).
    std::vector<std::optional<std::string>> parts;
};

struct DirectContent {
    nlohmann::json raw;
};

struct UnknownContent {
    std::string type_name;
};

struct AbsentContent {};

using ContentShape = std::variant<StringContent, ArrayContent, DirectContent,
                                  UnknownContent, AbsentContent>;

enum class ContentKind {
    String,
    Array,
    Direct,
    Unknown,
    Absent,
};

inline constexpr std::size_t kPreviewChars = 100;
inline constexpr const char* kPreviewMarker = "...";

// ---------------------------------------------------------------------------
// ExtractionResult - what the normalizer found.
//
// `preview` is the first kPreviewChars characters followed by "...", which
// is appended even when nothing was cut.
// ---------------------------------------------------------------------------
struct ExtractionResult {
    ContentKind kind = ContentKind::Absent;
    std::optional<std::size_t> character_count;
    std::optional<std::string> preview;
    std::optional<std::string> type_name;  // Unknown only
};

// Classify `record` by priority: message.content, then content, then absent.
// Never throws.
ContentShape ClassifyContent(const nlohmann::json& record);

// Join the text parts of an ArrayContent with single spaces.
std::string JoinParts(const ArrayContent& content);

ExtractionResult Normalize(const nlohmann::json& record);

// Name used in reports for a JSON value's type ("int", "float", ...).
std::string JsonTypeName(const nlohmann::json& value);

// Code-point aware length / prefix of UTF-8 text.
std::size_t Utf8Length(const std::string& text);
std::string Utf8Prefix(const std::string& text, std::size_t max_chars);

// Human-readable report, e.g. "String content: 11 chars\nhello world...".
std::string FormatReport(const ExtractionResult& result);

const char* ContentKindName(ContentKind kind);

} // namespace mcp_probe
