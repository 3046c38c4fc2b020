#include "warden/plan.hpp"

#include <cctype>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

void set_error(std::string* error, ErrorCode code, const std::string& message) {
  if (error) *error = to_string(code) + ": " + message;
}

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool read_operation(const jsonlite::Object& obj, const std::string& where, OperationRequest& out,
                    std::string* error) {
  out.operation_id = jsonlite::get_string(obj, "id");
  out.tool_name = jsonlite::get_string(obj, "tool");
  if (out.tool_name.empty()) {
    set_error(error, ErrorCode::schema_mismatch, where + ": \"tool\" is required");
    return false;
  }
  const auto* args = jsonlite::get_array(obj, "args");
  if (args) {
    for (const auto& a : *args) {
      // save_json documents may be given inline as objects.
      if (const auto* s = std::get_if<std::string>(&a.v)) {
        out.args.push_back(*s);
      } else {
        out.args.push_back(jsonlite::to_json(a));
      }
    }
  }
  out.dependencies = jsonlite::get_string_array(obj, "dependencies");
  return true;
}

}  // namespace

std::optional<SessionPlan> parse_plan_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }

  SessionPlan plan;
  plan.goal = jsonlite::get_string(root, "goal");
  const auto* steps = jsonlite::get_array(root, "steps");
  if (!steps) {
    set_error(error, ErrorCode::schema_mismatch, "\"steps\" array is required");
    return std::nullopt;
  }

  for (std::size_t i = 0; i < steps->size(); ++i) {
    const std::string where = "steps[" + std::to_string(i) + "]";
    const auto* obj = std::get_if<jsonlite::Object>(&(*steps)[i].v);
    if (!obj) {
      set_error(error, ErrorCode::schema_mismatch, where + " must be an object");
      return std::nullopt;
    }
    if (const auto* ops = jsonlite::get_array(*obj, "operations")) {
      BatchRequest batch;
      batch.batch_id = jsonlite::get_string(*obj, "batch_id", "batch-" + std::to_string(i + 1));
      batch.dependencies = jsonlite::get_string_array(*obj, "dependencies");
      for (std::size_t k = 0; k < ops->size(); ++k) {
        const std::string op_where = where + ".operations[" + std::to_string(k) + "]";
        const auto* op_obj = std::get_if<jsonlite::Object>(&(*ops)[k].v);
        if (!op_obj) {
          set_error(error, ErrorCode::schema_mismatch, op_where + " must be an object");
          return std::nullopt;
        }
        OperationRequest op;
        if (!read_operation(*op_obj, op_where, op, error)) return std::nullopt;
        batch.operations.push_back(std::move(op));
      }
      plan.steps.emplace_back(std::move(batch));
      continue;
    }
    OperationRequest op;
    if (!read_operation(*obj, where, op, error)) return std::nullopt;
    plan.steps.emplace_back(std::move(op));
  }
  return plan;
}

std::optional<SessionPlan> parse_tool_script(const std::string& text, const std::string& goal,
                                             std::string* error) {
  static const std::string kTool = "%%tool";
  static const std::string kPath = "%%path";
  static const std::string kContent = "%%content";
  static const std::string kEnd = "%%end";

  SessionPlan plan;
  plan.goal = goal;

  std::size_t pos = 0;
  while ((pos = text.find(kTool, pos)) != std::string::npos) {
    std::size_t cursor = pos + kTool.size();
    pos = cursor;

    const std::size_t tool_eol = text.find('\n', cursor);
    if (tool_eol == std::string::npos) break;
    const std::string tool = trim(text.substr(cursor, tool_eol - cursor));
    if (tool.empty()) continue;

    cursor = tool_eol + 1;
    if (text.compare(cursor, kPath.size(), kPath) != 0) continue;
    cursor += kPath.size();
    const std::size_t path_eol = text.find('\n', cursor);
    if (path_eol == std::string::npos) break;
    const std::string path = trim(text.substr(cursor, path_eol - cursor));
    if (path.empty()) continue;

    cursor = path_eol + 1;
    OperationRequest op;
    op.tool_name = tool;
    op.args.push_back(path);
    if (text.compare(cursor, kContent.size(), kContent) == 0) {
      cursor += kContent.size();
      const std::size_t end = text.find(kEnd, cursor);
      if (end == std::string::npos) {
        set_error(error, ErrorCode::missing_input, "unterminated %%content block for " + path);
        return std::nullopt;
      }
      op.args.push_back(trim(text.substr(cursor, end - cursor)));
      pos = end + kEnd.size();
    } else if (text.compare(cursor, kEnd.size(), kEnd) == 0) {
      pos = cursor + kEnd.size();
    } else {
      continue;
    }
    plan.steps.emplace_back(std::move(op));
  }

  if (plan.steps.empty()) {
    set_error(error, ErrorCode::missing_input, "no %%tool blocks found");
    return std::nullopt;
  }
  return plan;
}

}  // namespace warden
