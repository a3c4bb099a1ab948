#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

namespace arbiter {

/// Named set of loaded trees, one entry point per domain tree.
/// MUST key entries by the tree's declared name, falling back to the file stem.
/// Entries are immutable and safe to evaluate concurrently once loading is done.
class TreeCatalog {
 public:
  /// Loads every *.json file in dir (non-recursive, sorted by file name).
  /// Throws AuthoringError on duplicate names or malformed trees and
  /// std::runtime_error when dir cannot be read.
  static TreeCatalog load_directory(const std::string& dir,
                                    const OperatorRegistry& registry = default_registry());

  /// Adds tree under its name. MUST throw AuthoringError on an empty or duplicate name.
  void add(DecisionTree tree);
  const DecisionTree* find(const std::string& name) const;
  std::vector<std::string> names() const;
  size_t size() const { return trees_.size(); }

 private:
  std::map<std::string, std::shared_ptr<const DecisionTree>> trees_;
};

/// Returns the catalog directory from ARBITER_TREE_DIR, or "trees" when unset.
std::string default_tree_dir();

}  // namespace arbiter
