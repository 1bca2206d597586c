#include <mcp_probe/content/content_normalizer.hpp>

#include <sstream>

namespace mcp_probe {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

ExtractionResult TextResult(ContentKind kind, const std::string& text) {
    ExtractionResult result;
    result.kind = kind;
    result.character_count = Utf8Length(text);
    result.preview = Utf8Prefix(text, kPreviewChars) + kPreviewMarker;
    return result;
}

} // anonymous namespace

std::string JsonTypeName(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:            return "null";
        case nlohmann::json::value_t::boolean:         return "bool";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "int";
        case nlohmann::json::value_t::number_float:    return "float";
        case nlohmann::json::value_t::string:          return "str";
        case nlohmann::json::value_t::array:           return "list";
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::binary:          return "binary";
        case nlohmann::json::value_t::discarded:       return "discarded";
    }
    return "unknown";
}

std::size_t Utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!IsContinuationByte(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string Utf8Prefix(const std::string& text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!IsContinuationByte(static_cast<unsigned char>(text[i]))) {
            if (chars == max_chars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

ContentShape ClassifyContent(const nlohmann::json& record) {
    if (record.is_object()) {
        auto message = record.find("message");
        if (message != record.end() && message->is_object()) {
            auto content = message->find("content");
            if (content != message->end()) {
                if (content->is_string()) {
                    return StringContent{content->get<std::string>()};
                }
                if (content->is_array()) {
                    ArrayContent array;
                    for (const auto& part : *content) {
                        std::optional<std::string> text;
                        if (part.is_object()) {
                            auto t = part.find("text");
                            if (t != part.end() && t->is_string()) {
                                text = t->get<std::string>();
                            }
                        }
                        array.parts.push_back(std::move(text));
                    }
                    return array;
                }
                return UnknownContent{JsonTypeName(*content)};
            }
        }

        auto direct = record.find("content");
        if (direct != record.end()) {
            return DirectContent{*direct};
        }
    }
    return AbsentContent{};
}

std::string JoinParts(const ArrayContent& content) {
    std::string joined;
    bool first = true;
    for (const auto& part : content.parts) {
        if (!part.has_value()) continue;
        if (!first) joined.push_back(' ');
        joined += *part;
        first = false;
    }
    return joined;
}

ExtractionResult Normalize(const nlohmann::json& record) {
    return std::visit(Overloaded{
        [](const StringContent& c) {
            return TextResult(ContentKind::String, c.text);
        },
        [](const ArrayContent& c) {
            return TextResult(ContentKind::Array, JoinParts(c));
        },
        [](const DirectContent& c) {
            ExtractionResult result;
            result.kind = ContentKind::Direct;
            const std::string repr = c.raw.is_string()
                ? c.raw.get<std::string>()
                : c.raw.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace);
            result.character_count = Utf8Length(repr);
            return result;
        },
        [](const UnknownContent& c) {
            ExtractionResult result;
            result.kind = ContentKind::Unknown;
            result.type_name = c.type_name;
            return result;
        },
        [](const AbsentContent&) {
            return ExtractionResult{};
        },
    }, ClassifyContent(record));
}

const char* ContentKindName(ContentKind kind) {
    switch (kind) {
        case ContentKind::String:  return "String";
        case ContentKind::Array:   return "Array";
        case ContentKind::Direct:  return "Direct";
        case ContentKind::Unknown: return "Unknown";
        case ContentKind::Absent:  return "Absent";
    }
    return "Unknown";
}

std::string FormatReport(const ExtractionResult& result) {
    std::ostringstream oss;
    switch (result.kind) {
        case ContentKind::String:
        case ContentKind::Array:
            oss << ContentKindName(result.kind) << " content: "
                << result.character_count.value_or(0) << " chars\n"
                << result.preview.value_or("");
            break;
        case ContentKind::Direct:
            oss << "Direct content: " << result.character_count.value_or(0)
                << " chars";
            break;
        case ContentKind::Unknown:
            oss << "Unknown content type: " << result.type_name.value_or("unknown");
            break;
        case ContentKind::Absent:
            oss << "No content found";
            break;
    }
    return oss.str();
}

} // namespace mcp_probe
