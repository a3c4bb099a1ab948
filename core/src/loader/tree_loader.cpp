#include "arbiter/tree_loader.h"

#include <cstdint>
#include <limits>

#include "arbiter/errors.h"
#include "loader_internal.h"

namespace arbiter {

namespace {

using ojson = nlohmann::ordered_json;

NodePtr parse_node(const ojson& raw, const OperatorRegistry& registry, const std::string& where);

std::string scalar_leaf_text(const ojson& raw) {
  if (raw.is_string()) return raw.get<std::string>();
  return value_from_json(raw).to_text();
}

Branch parse_branch_entry(const ojson& entry,
                          const OperatorRegistry& registry,
                          const std::string& where) {
  if (!entry.is_object() || !entry.contains("when") || !entry.contains("then")) {
    throw AuthoringError("Branch at " + where + " must be an object with 'when' and 'then'");
  }
  Branch branch;
  branch.key = classify_branch_key(entry["when"], registry, where + ".when");
  branch.target = parse_node(entry["then"], registry, where + ".then");
  return branch;
}

std::vector<Branch> parse_branches(const ojson& raw,
                                   const OperatorRegistry& registry,
                                   const std::string& where) {
  std::vector<Branch> out;
  if (raw.is_array()) {
    for (size_t i = 0; i < raw.size(); ++i) {
      out.push_back(parse_branch_entry(raw[i], registry, where + "[" + std::to_string(i) + "]"));
    }
  } else if (raw.is_object()) {
    // Object form: each key is a string literal; ordered_json keeps authored order.
    for (auto it = raw.begin(); it != raw.end(); ++it) {
      Branch branch;
      branch.key = literal_key(make_string(it.key()));
      branch.target = parse_node(it.value(), registry, where + "." + it.key());
      out.push_back(std::move(branch));
    }
  } else {
    throw AuthoringError("'branches' at " + where + " must be an array or an object");
  }
  if (out.empty()) {
    throw AuthoringError("'branches' at " + where + " must not be empty");
  }
  return out;
}

NodePtr parse_node(const ojson& raw, const OperatorRegistry& registry, const std::string& where) {
  if (raw.is_object()) {
    if (!raw.contains("question") || !raw["question"].is_string()) {
      throw AuthoringError("Node at " + where + " is missing a string 'question'");
    }
    if (!raw.contains("branches")) {
      throw AuthoringError("Node at " + where + " is missing 'branches'");
    }
    std::optional<std::string> variable;
    if (raw.contains("variable") && !raw["variable"].is_null()) {
      if (!raw["variable"].is_string() || raw["variable"].get<std::string>().empty()) {
        throw AuthoringError("'variable' at " + where + " must be a non-empty string");
      }
      variable = raw["variable"].get<std::string>();
    }
    std::vector<Branch> branches = parse_branches(raw["branches"], registry, where + ".branches");
    return make_question(raw["question"].get<std::string>(), std::move(variable),
                         std::move(branches));
  }
  if (raw.is_array()) {
    throw AuthoringError("Node at " + where + " must be a question object or a leaf string");
  }
  return make_leaf(scalar_leaf_text(raw));
}

std::vector<InputSpec> parse_inputs(const ojson& raw) {
  std::vector<InputSpec> out;
  if (!raw.is_object()) {
    throw AuthoringError("'inputs' must be an object keyed by input name");
  }
  for (auto it = raw.begin(); it != raw.end(); ++it) {
    InputSpec spec;
    spec.name = it.key();
    const ojson& body = it.value();
    if (body.is_string()) {
      spec.description = body.get<std::string>();
    } else if (body.is_object()) {
      spec.type = body.value("type", "");
      spec.description = body.value("description", "");
    } else {
      throw AuthoringError("Input '" + spec.name + "' must be a description string or an object");
    }
    out.push_back(std::move(spec));
  }
  return out;
}

ojson parse_document(const std::string& text, const std::string& origin) {
  try {
    return ojson::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw AuthoringError("Invalid tree JSON in " + origin + ": " + ex.what());
  }
}

}  // namespace

Value value_from_json(const ojson& raw, const std::string& where) {
  if (raw.is_null()) return make_null();
  if (raw.is_boolean()) return make_bool(raw.get<bool>());
  if (raw.is_number_unsigned()) {
    uint64_t value = raw.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw AuthoringError("Integer at " + where + " is out of range: " + raw.dump());
    }
    return make_integer(static_cast<int64_t>(value));
  }
  if (raw.is_number_integer()) return make_integer(raw.get<int64_t>());
  if (raw.is_number_float()) return make_real(raw.get<double>());
  if (raw.is_string()) return make_string(raw.get<std::string>());
  if (raw.is_array()) {
    std::vector<Value> items;
    items.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
      items.push_back(value_from_json(raw[i], where + "[" + std::to_string(i) + "]"));
    }
    return make_list(std::move(items));
  }
  if (raw.is_object() && raw.size() == 1 && raw.contains("range")) {
    const ojson& bounds = raw["range"];
    if (!bounds.is_array() || bounds.size() != 2 || !bounds[0].is_number_integer() ||
        !bounds[1].is_number_integer()) {
      throw AuthoringError("'range' at " + where + " must be [lo, hi] integers");
    }
    return make_range(bounds[0].get<int64_t>(), bounds[1].get<int64_t>());
  }
  throw AuthoringError("Unsupported value at " + where + ": " + raw.dump());
}

ojson value_to_json(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Null:
      return nullptr;
    case Value::Kind::Bool:
      return value.bool_value;
    case Value::Kind::Integer:
      return value.int_value;
    case Value::Kind::Real:
      return value.real_value;
    case Value::Kind::String:
      return value.string_value;
    case Value::Kind::List: {
      ojson out = ojson::array();
      for (const auto& item : value.list_value) out.push_back(value_to_json(item));
      return out;
    }
    case Value::Kind::Range:
      return ojson{{"range", {value.range_lo, value.range_hi}}};
  }
  return nullptr;
}

BranchKey classify_branch_key(const ojson& raw,
                              const OperatorRegistry& registry,
                              const std::string& where) {
  if (raw.is_object() && raw.size() == 1 && raw.contains("predicate")) {
    if (!raw["predicate"].is_string()) {
      throw AuthoringError("'predicate' at " + where + " must name a registered predicate");
    }
    std::string name = raw["predicate"].get<std::string>();
    return predicate_key(name, registry.lookup_predicate(name));
  }
  if (raw.is_array() && raw.size() == 2 && raw[0].is_string()) {
    return operator_key(raw[0].get<std::string>(), value_from_json(raw[1], where + "[1]"));
  }
  return literal_key(value_from_json(raw, where));
}

DecisionTree load_tree(const ojson& doc, const OperatorRegistry& registry) {
  DecisionTree tree;
  const ojson* root = &doc;
  if (doc.is_object() && doc.contains("tree")) {
    if (doc.contains("name")) {
      if (!doc["name"].is_string()) throw AuthoringError("'name' must be a string");
      tree.name = doc["name"].get<std::string>();
    }
    if (doc.contains("description")) {
      if (!doc["description"].is_string()) throw AuthoringError("'description' must be a string");
      tree.description = doc["description"].get<std::string>();
    }
    if (doc.contains("inputs")) {
      tree.inputs = parse_inputs(doc["inputs"]);
    }
    root = &doc["tree"];
  }
  tree.root = parse_node(*root, registry, "tree");
  return tree;
}

DecisionTree load_tree_from_string(const std::string& text, const OperatorRegistry& registry) {
  return load_tree(parse_document(text, "<string>"), registry);
}

DecisionTree load_tree_from_file(const std::string& path, const OperatorRegistry& registry) {
  std::string text = loader_internal::read_file(path);
  return load_tree(parse_document(text, path), registry);
}

DecisionTree load_tree_from_url(const std::string& url,
                                int timeout_ms,
                                const OperatorRegistry& registry) {
  std::string text = loader_internal::fetch_url(url, timeout_ms);
  return load_tree(parse_document(text, url), registry);
}

bool context_from_json(const ojson& obj, EvaluationContext& context, std::string& error) {
  if (!obj.is_object()) {
    error = "Inputs must be a JSON object";
    return false;
  }
  EvaluationContext out = context;
  try {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      out.set(it.key(), value_from_json(it.value(), it.key()));
    }
  } catch (const AuthoringError& ex) {
    error = std::string("Invalid input value: ") + ex.what();
    return false;
  }
  context = std::move(out);
  return true;
}

bool parse_input_assignment(const std::string& assignment,
                            EvaluationContext& context,
                            std::string& error) {
  size_t eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) {
    error = "Expected name=value, got: " + assignment;
    return false;
  }
  std::string name = assignment.substr(0, eq);
  std::string raw = assignment.substr(eq + 1);
  ojson parsed = ojson::parse(raw, nullptr, false);
  if (parsed.is_discarded() || parsed.is_object()) {
    context.set(name, make_string(raw));
    return true;
  }
  try {
    context.set(name, value_from_json(parsed, name));
  } catch (const AuthoringError& ex) {
    error = std::string("Invalid value for ") + name + ": " + ex.what();
    return false;
  }
  return true;
}

}  // namespace arbiter
