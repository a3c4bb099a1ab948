#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "arbiter/input_resolver.h"
#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

namespace arbiter {

/// Classifies one authored branch key into Predicate, OperatorMatch or Literal.
/// MUST run once per key at load time; predicate names resolve against registry.
/// Throws AuthoringError for unknown predicates or unsupported reference shapes.
BranchKey classify_branch_key(const nlohmann::ordered_json& raw,
                              const OperatorRegistry& registry,
                              const std::string& where = "key");

/// Converts an authored JSON value into a Value ({"range": [lo, hi]} becomes a Range).
/// Throws AuthoringError for objects that are not ranges.
Value value_from_json(const nlohmann::ordered_json& raw, const std::string& where = "value");
nlohmann::ordered_json value_to_json(const Value& value);

/// Builds a tree from a parsed document; accepts a {"tree": ...} wrapper or a bare node.
/// MUST reject malformed node shapes with AuthoringError naming the JSON path.
DecisionTree load_tree(const nlohmann::ordered_json& doc, const OperatorRegistry& registry);
DecisionTree load_tree_from_string(const std::string& text,
                                   const OperatorRegistry& registry = default_registry());
/// Loads a tree from disk. MUST throw std::runtime_error on IO failures.
DecisionTree load_tree_from_file(const std::string& path,
                                 const OperatorRegistry& registry = default_registry());
/// Fetches and loads a tree over HTTP(S). MUST fail when built without libcurl.
DecisionTree load_tree_from_url(const std::string& url,
                                int timeout_ms,
                                const OperatorRegistry& registry = default_registry());

/// Builds an ordered context from a JSON object, keeping the document's key order.
/// Returns false and sets error when obj is not an object or holds an unsupported value.
bool context_from_json(const nlohmann::ordered_json& obj,
                       EvaluationContext& context,
                       std::string& error);
/// Parses "name=value"; value is read as JSON when valid, otherwise as a plain string.
bool parse_input_assignment(const std::string& assignment,
                            EvaluationContext& context,
                            std::string& error);

}  // namespace arbiter
