#pragma once
#include "stream_event.hpp"
#include <string>
#include <vector>

namespace chunkflow {

// Default content filter for streamed model output. Removes <|...|> control
// tokens (plain and JSON-escaped), "commentary to=NAME {...}" tool
// invocations, and collapses runs of three or more newlines to two.
std::string sanitize_llm_output(const std::string& text);

struct CommentaryExtraction {
    std::vector<ToolCall> calls;   // ids are left empty; the caller assigns them
    std::string remaining;         // text with extracted invocations removed, trimmed
};

// Parse tool calls that a model wrote as text instead of native tool calls:
//   commentary to=NAME [json]{...}
//   <tool_call>{"name": ..., "arguments": ...}</tool_call>
// Invocations whose JSON cannot be parsed (even after repair) are skipped and
// left in the remaining text.
CommentaryExtraction extract_commentary_tool_calls(const std::string& text);

// Try to repair truncated or sloppy JSON from LLM output: close an open
// string, close open brackets in nesting order, drop trailing commas.
// Returns the input unchanged if the result still does not parse.
std::string repair_json(const std::string& json_str);

} // namespace chunkflow
