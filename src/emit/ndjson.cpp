#include <tabstream/emit/ndjson.hpp>

#include <fmt/format.h>

#include <cmath>
#include <iterator>

namespace tabstream::emit {

void append_json_string(std::string& out, std::string_view text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\b':
                out.append("\\b");
                break;
            case '\f':
                out.append("\\f");
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}",
                                   static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void append_json_value(std::string& out, const Value& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out.append("null");
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                fmt::format_to(std::back_inserter(out), "{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    out.append("null");
                } else {
                    fmt::format_to(std::back_inserter(out), "{}", v);
                }
            } else {
                append_json_string(out, v);
            }
        },
        value);
}

auto to_ndjson(const Record& record) -> std::string {
    std::string out;
    out.reserve(16 * record.values.size() + 2);
    out.push_back('{');
    for (std::size_t i = 0; i < record.values.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        append_json_string(out, record.schema->name(i));
        out.push_back(':');
        append_json_value(out, record.values[i]);
    }
    out.append("}\n");
    return out;
}

}  // namespace tabstream::emit
