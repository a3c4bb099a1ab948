#pragma once

#include <string>
#include <vector>

#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

namespace arbiter {

/// Outcome of matching one value against a node's branches.
/// matched == false is the no-match sentinel; target is null in that case.
struct BranchMatch {
  bool matched = false;
  size_t index = 0;
  NodePtr target;
};

/// Selects the first branch, in authored order, whose key accepts value.
/// MUST append one trace entry per key tested, up to and including the match.
/// Inputs are branches/value/subject/registry; side effects are trace appends.
/// Exceptions thrown by predicates or operators propagate unmodified; an
/// unregistered operator symbol throws AuthoringError.
BranchMatch match_branch(const std::vector<Branch>& branches,
                         const Value& value,
                         const std::string& subject,
                         const OperatorRegistry& registry,
                         std::vector<std::string>& trace);

}  // namespace arbiter
