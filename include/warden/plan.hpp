#pragma once

// warden/plan.hpp: Session plan readers.
//
// Plan JSON:
//   {"goal": "...",
//    "steps": [ {"id": "a", "tool": "write_file", "args": ["p", "x"], "dependencies": []},
//               {"batch_id": "b", "dependencies": [], "operations": [ <operation>, ... ]} ]}
//
// Tool script (the assistant's command block format):
//   %%tool write_file
//   %%path notes.txt
//   %%content
//   hello
//   %%end
// Blocks without content end at "%%end" directly after the %%path line.
// Content is trimmed of surrounding whitespace. Text between blocks is ignored.

#include <optional>
#include <string>

#include "warden/session.hpp"

namespace warden {

// On failure returns nullopt and sets *error to "<error_code>: <message>".
std::optional<SessionPlan> parse_plan_json(const std::string& text, std::string* error);

std::optional<SessionPlan> parse_tool_script(const std::string& text, const std::string& goal,
                                             std::string* error);

}  // namespace warden
