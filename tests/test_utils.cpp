#include "test_utils.h"

#include "arbiter/tree_loader.h"

#ifndef ARBITER_TREES_DIR
#define ARBITER_TREES_DIR "trees"
#endif

std::string sample_trees_dir() { return ARBITER_TREES_DIR; }

arbiter::DecisionTree load_sample_tree(const std::string& name) {
  return arbiter::load_tree_from_file(sample_trees_dir() + "/" + name + ".json");
}

arbiter::DecisionTree tree_from_json(const std::string& json,
                                     const arbiter::OperatorRegistry& registry) {
  return arbiter::load_tree_from_string(json, registry);
}
