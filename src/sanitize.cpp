#include "sanitize.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <optional>

namespace chunkflow {

namespace {

constexpr size_t kMaxControlTokenLength = 64;

struct Invocation {
    size_t start = 0;
    size_t end = 0;        // one past the last consumed character
    bool xml = false;
    std::string name;      // commentary form only
    std::string payload;   // JSON text, possibly truncated
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Remove every open...close span whose body is short and single-line.
std::string strip_delimited(const std::string& s, const std::string& open,
                            const std::string& close) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        size_t start = s.find(open, pos);
        if (start == std::string::npos) break;
        size_t inner = start + open.size();
        size_t end = s.find(close, inner);
        if (end == std::string::npos || end - inner > kMaxControlTokenLength ||
            s.find('\n', inner) < end) {
            out.append(s, pos, inner - pos);
            pos = inner;
            continue;
        }
        out.append(s, pos, start - pos);
        pos = end + close.size();
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::string strip_control_tokens(const std::string& s) {
    std::string out = strip_delimited(s, "<|", "|>");
    return strip_delimited(out, "\\u003c|", "|\\u003e");
}

// Index one past the bracket that closes the one at `open`, or npos if the
// text ends first.
size_t find_json_end(const std::string& s, size_t open) {
    int depth = 0;
    bool in_string = false;
    bool escape = false;
    for (size_t i = open; i < s.size(); ++i) {
        char c = s[i];
        if (in_string) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{' || c == '[') {
            depth++;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) return i + 1;
        }
    }
    return std::string::npos;
}

std::optional<Invocation> match_commentary(const std::string& text, size_t at) {
    static const std::string keyword = "commentary";
    if (at > 0 && is_tool_name_char(text[at - 1])) return std::nullopt;

    size_t i = at + keyword.size();
    while (i < text.size() && is_space(text[i])) ++i;
    if (text.compare(i, 3, "to=") != 0) return std::nullopt;
    i += 3;

    size_t name_start = i;
    while (i < text.size() && is_tool_name_char(text[i])) ++i;
    if (i == name_start) return std::nullopt;

    Invocation inv;
    inv.start = at;
    inv.name = text.substr(name_start, i - name_start);

    while (i < text.size() && is_space(text[i])) ++i;
    if (text.compare(i, 4, "json") == 0) {
        i += 4;
        while (i < text.size() && is_space(text[i])) ++i;
    }
    if (i >= text.size() || text[i] != '{') return std::nullopt;

    size_t end = find_json_end(text, i);
    if (end == std::string::npos) end = text.size();
    inv.payload = text.substr(i, end - i);
    inv.end = end;
    return inv;
}

std::optional<Invocation> match_xml(const std::string& text, size_t at) {
    static const std::string open_tag = "<tool_call>";
    static const std::string close_tag = "</tool_call>";

    size_t content_start = at + open_tag.size();
    size_t close = text.find(close_tag, content_start);
    if (close == std::string::npos) return std::nullopt;

    Invocation inv;
    inv.start = at;
    inv.xml = true;
    inv.payload = trim(text.substr(content_start, close - content_start));
    inv.end = close + close_tag.size();
    return inv;
}

std::vector<Invocation> scan_invocations(const std::string& text) {
    std::vector<Invocation> found;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t c = text.find("commentary", pos);
        size_t x = text.find("<tool_call>", pos);
        size_t at = std::min(c, x);
        if (at == std::string::npos) break;

        auto inv = (at == x) ? match_xml(text, at) : match_commentary(text, at);
        if (inv) {
            pos = inv->end;
            found.push_back(std::move(*inv));
        } else {
            pos = at + 1;
        }
    }
    return found;
}

std::optional<ToolCall> to_tool_call(const Invocation& inv) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(repair_json(inv.payload));
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    ToolCall call;
    if (!inv.xml) {
        call.name = inv.name;
        call.arguments = j.dump();
        return call;
    }

    if (j.contains("name") && j["name"].is_string()) {
        call.name = j["name"].get<std::string>();
    }
    if (call.name.empty()) return std::nullopt;

    if (j.contains("arguments")) {
        const auto& args = j["arguments"];
        if (args.is_string()) {
            call.arguments = args.get<std::string>();
        } else {
            call.arguments = args.dump();
        }
    } else {
        call.arguments = "{}";
    }
    return call;
}

} // namespace

std::string sanitize_llm_output(const std::string& text) {
    if (text.empty()) return "";

    std::string stripped = strip_control_tokens(text);

    std::string out;
    out.reserve(stripped.size());
    size_t pos = 0;
    for (const auto& inv : scan_invocations(stripped)) {
        if (inv.xml) continue;
        out.append(stripped, pos, inv.start - pos);
        pos = inv.end;
    }
    out.append(stripped, pos, std::string::npos);

    return collapse_newlines(out, 2);
}

CommentaryExtraction extract_commentary_tool_calls(const std::string& text) {
    CommentaryExtraction result;
    if (text.empty()) return result;

    std::string stripped = strip_control_tokens(text);

    std::string remaining;
    remaining.reserve(stripped.size());
    size_t pos = 0;
    for (const auto& inv : scan_invocations(stripped)) {
        auto call = to_tool_call(inv);
        if (!call) continue; // unparseable: stays in the remaining text

        call->index = static_cast<int>(result.calls.size());
        result.calls.push_back(std::move(*call));
        remaining.append(stripped, pos, inv.start - pos);
        pos = inv.end;
    }
    remaining.append(stripped, pos, std::string::npos);

    result.remaining = result.calls.empty() ? text : trim(remaining);
    return result;
}

std::string repair_json(const std::string& json_str) {
    std::string s;
    s.reserve(json_str.size() + 8);

    // Close what is open, in nesting order
    std::vector<char> closers;
    bool in_string = false;
    bool escape = false;
    for (char c : json_str) {
        s += c;
        if (in_string) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            closers.push_back('}');
        } else if (c == '[') {
            closers.push_back(']');
        } else if ((c == '}' || c == ']') && !closers.empty() && closers.back() == c) {
            closers.pop_back();
        }
    }
    if (escape) s.pop_back();
    if (in_string) s += '"';
    while (!closers.empty()) {
        s += closers.back();
        closers.pop_back();
    }

    // Remove trailing commas before } or ]
    std::string result;
    result.reserve(s.size());
    in_string = false;
    escape = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (in_string) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_string = false;
        } else if (c == '"') {
            in_string = true;
        } else if (c == ',') {
            size_t j = i + 1;
            while (j < s.size() && is_space(s[j])) j++;
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        result += c;
    }

    // Try to parse; if fails, return original
    try {
        (void)nlohmann::json::parse(result);
        return result;
    } catch (const nlohmann::json::parse_error&) {
        return json_str;
    }
}

} // namespace chunkflow
