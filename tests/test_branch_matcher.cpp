#include "test_harness.h"
#include "test_utils.h"

#include <stdexcept>

#include "arbiter/branch_matcher.h"
#include "arbiter/errors.h"

namespace {

std::vector<arbiter::Branch> overlapping_branches() {
  std::vector<arbiter::Branch> branches;
  branches.push_back({arbiter::operator_key(">=", arbiter::make_integer(100)),
                      arbiter::make_leaf("High - first")});
  branches.push_back({arbiter::operator_key(">=", arbiter::make_integer(50)),
                      arbiter::make_leaf("Medium - second")});
  branches.push_back({arbiter::operator_key(">=", arbiter::make_integer(0)),
                      arbiter::make_leaf("Low - third")});
  return branches;
}

const arbiter::Leaf* leaf_of(const arbiter::BranchMatch& match) {
  if (!match.target) return nullptr;
  return std::get_if<arbiter::Leaf>(match.target.get());
}

void test_first_match_wins() {
  arbiter::OperatorRegistry registry;
  std::vector<std::string> trace;
  auto branches = overlapping_branches();
  arbiter::BranchMatch match =
      arbiter::match_branch(branches, arbiter::make_integer(150), "score", registry, trace);
  expect_true(match.matched, "150 matches");
  expect_eq(match.index, 0, "earliest overlapping branch selected");
  const arbiter::Leaf* leaf = leaf_of(match);
  expect_true(leaf && leaf->decision == "High", "first branch target");
  expect_eq(trace.size(), 1, "only the tested key is traced");
}

void test_trace_records_every_key_tested() {
  arbiter::OperatorRegistry registry;
  std::vector<std::string> trace;
  auto branches = overlapping_branches();
  arbiter::BranchMatch match =
      arbiter::match_branch(branches, arbiter::make_integer(10), "score", registry, trace);
  expect_true(match.matched, "10 matches the last branch");
  expect_eq(match.index, 2, "third branch selected");
  expect_eq(trace.size(), 3, "three keys tested");
  if (trace.size() == 3) {
    expect_str_eq(trace[0], "Checked score: 10 >= 100 -> False", "first trace entry");
    expect_str_eq(trace[2], "Checked score: 10 >= 0 -> True", "matching trace entry");
  }
}

void test_no_match_is_sentinel() {
  arbiter::OperatorRegistry registry;
  std::vector<std::string> trace;
  auto branches = overlapping_branches();
  arbiter::BranchMatch match =
      arbiter::match_branch(branches, arbiter::make_integer(-5), "score", registry, trace);
  expect_true(!match.matched, "no branch accepts -5");
  expect_true(match.target == nullptr, "no target on sentinel");
  expect_eq(trace.size(), 3, "exhaustion traced");
}

void test_literal_and_predicate_keys() {
  arbiter::OperatorRegistry registry;
  std::vector<arbiter::Branch> branches;
  branches.push_back({arbiter::predicate_key("is_empty",
                                             [](const arbiter::Value& v) {
                                               return v.kind == arbiter::Value::Kind::String &&
                                                      v.string_value.empty();
                                             }),
                      arbiter::make_leaf("Empty")});
  branches.push_back({arbiter::literal_key(arbiter::make_string("CAR")),
                      arbiter::make_leaf("Car")});
  std::vector<std::string> trace;
  arbiter::BranchMatch match =
      arbiter::match_branch(branches, arbiter::make_string("CAR"), "purpose", registry, trace);
  expect_true(match.matched && match.index == 1, "literal branch selected");
  expect_eq(trace.size(), 2, "predicate and literal traced");
  if (trace.size() == 2) {
    expect_str_eq(trace[0], "Checked purpose: predicate is_empty('CAR') -> False",
                  "predicate trace");
    expect_str_eq(trace[1], "Checked purpose: 'CAR' == 'CAR' -> True", "literal trace");
  }
}

void test_unregistered_operator_throws() {
  arbiter::OperatorRegistry registry;
  std::vector<arbiter::Branch> branches;
  branches.push_back({arbiter::operator_key("between", arbiter::make_list({})),
                      arbiter::make_leaf("x")});
  std::vector<std::string> trace;
  bool threw = throws_as<arbiter::AuthoringError>([&]() {
    arbiter::match_branch(branches, arbiter::make_integer(1), "x", registry, trace);
  });
  expect_true(threw, "unknown symbol raises AuthoringError");
}

void test_predicate_exception_propagates() {
  arbiter::OperatorRegistry registry;
  std::vector<arbiter::Branch> branches;
  branches.push_back({arbiter::predicate_key("explodes",
                                             [](const arbiter::Value&) -> bool {
                                               throw std::logic_error("boom");
                                             }),
                      arbiter::make_leaf("x")});
  std::vector<std::string> trace;
  bool threw = throws_as<std::logic_error>([&]() {
    arbiter::match_branch(branches, arbiter::make_integer(1), "x", registry, trace);
  });
  expect_true(threw, "predicate exception propagates unmodified");
}

}  // namespace

void register_branch_matcher_tests(std::vector<TestCase>& tests) {
  tests.push_back({"matcher_first_match_wins", test_first_match_wins});
  tests.push_back({"matcher_trace_every_key", test_trace_records_every_key_tested});
  tests.push_back({"matcher_no_match_sentinel", test_no_match_is_sentinel});
  tests.push_back({"matcher_literal_and_predicate", test_literal_and_predicate_keys});
  tests.push_back({"matcher_unregistered_operator", test_unregistered_operator_throws});
  tests.push_back({"matcher_predicate_exception", test_predicate_exception_propagates});
}
