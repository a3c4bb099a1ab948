#pragma once

#include <string>

#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

/// Loads trees/<name>.json from the source tree.
arbiter::DecisionTree load_sample_tree(const std::string& name);
arbiter::DecisionTree tree_from_json(const std::string& json,
                                     const arbiter::OperatorRegistry& registry);
std::string sample_trees_dir();
/// Returns true when fn throws an exception of type E.
template <typename E, typename Fn>
bool throws_as(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (...) {
    return false;
  }
  return false;
}
