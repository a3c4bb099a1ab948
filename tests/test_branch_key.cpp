#include "test_harness.h"
#include "test_utils.h"

#include <variant>

#include <nlohmann/json.hpp>

#include "arbiter/errors.h"
#include "arbiter/tree_loader.h"

namespace {

using ojson = nlohmann::ordered_json;

void test_operator_tuple_is_classified_as_operator_match() {
  arbiter::OperatorRegistry registry;
  arbiter::BranchKey key = arbiter::classify_branch_key(ojson::parse(R"(["<", 640])"), registry);
  const auto* op = std::get_if<arbiter::OperatorKey>(&key);
  expect_true(op != nullptr, "pair with text head is OperatorMatch");
  if (!op) return;
  expect_str_eq(op->symbol, "<", "operator symbol");
  expect_true(op->reference.kind == arbiter::Value::Kind::Integer && op->reference.int_value == 640,
              "operator reference");
}

void test_unregistered_symbol_is_still_classified() {
  arbiter::OperatorRegistry registry;
  arbiter::BranchKey key =
      arbiter::classify_branch_key(ojson::parse(R"(["between", [1, 2]])"), registry);
  expect_true(std::holds_alternative<arbiter::OperatorKey>(key),
              "unknown symbols are resolved at evaluation, not at load");
}

void test_predicate_object_is_classified_as_predicate() {
  arbiter::OperatorRegistry registry;
  registry.register_predicate("is_positive", [](const arbiter::Value& v) {
    return v.is_number() && *v.as_number() > 0;
  });
  arbiter::BranchKey key =
      arbiter::classify_branch_key(ojson::parse(R"({"predicate": "is_positive"})"), registry);
  const auto* pred = std::get_if<arbiter::PredicateKey>(&key);
  expect_true(pred != nullptr, "predicate object is Predicate");
  if (!pred) return;
  expect_str_eq(pred->name, "is_positive", "predicate name");
  expect_true(pred->fn(arbiter::make_integer(3)), "predicate function bound");
}

void test_unknown_predicate_is_authoring_error() {
  arbiter::OperatorRegistry registry;
  bool threw = throws_as<arbiter::AuthoringError>([&]() {
    arbiter::classify_branch_key(ojson::parse(R"({"predicate": "missing"})"), registry);
  });
  expect_true(threw, "unknown predicate fails at load");
}

void test_scalars_are_literals() {
  arbiter::OperatorRegistry registry;
  for (const char* raw : {R"("CAR")", "true", "42", "null", "2.5"}) {
    arbiter::BranchKey key = arbiter::classify_branch_key(ojson::parse(raw), registry);
    expect_true(std::holds_alternative<arbiter::LiteralKey>(key),
                std::string("literal classification for ") + raw);
  }
}

void test_pair_without_text_head_is_literal() {
  arbiter::OperatorRegistry registry;
  arbiter::BranchKey key = arbiter::classify_branch_key(ojson::parse("[1, 2]"), registry);
  const auto* lit = std::get_if<arbiter::LiteralKey>(&key);
  expect_true(lit != nullptr, "numeric pair is a literal list");
  if (lit) {
    expect_true(lit->value.kind == arbiter::Value::Kind::List, "literal holds list");
  }
  key = arbiter::classify_branch_key(ojson::parse(R"(["a", "b", "c"])"), registry);
  expect_true(std::holds_alternative<arbiter::LiteralKey>(key), "three-element list is literal");
}

void test_range_reference() {
  arbiter::OperatorRegistry registry;
  arbiter::BranchKey key =
      arbiter::classify_branch_key(ojson::parse(R"(["in", {"range": [120, 130]}])"), registry);
  const auto* op = std::get_if<arbiter::OperatorKey>(&key);
  expect_true(op != nullptr && op->reference.kind == arbiter::Value::Kind::Range,
              "range reference");
  if (op) {
    expect_true(op->reference.range_lo == 120 && op->reference.range_hi == 130, "range bounds");
  }
}

void test_object_literal_is_rejected() {
  arbiter::OperatorRegistry registry;
  bool threw = throws_as<arbiter::AuthoringError>([&]() {
    arbiter::classify_branch_key(ojson::parse(R"({"op": "<"})"), registry);
  });
  expect_true(threw, "arbitrary objects are not valid keys");
}

}  // namespace

void register_branch_key_tests(std::vector<TestCase>& tests) {
  tests.push_back({"branch_key_operator_match", test_operator_tuple_is_classified_as_operator_match});
  tests.push_back({"branch_key_unregistered_symbol", test_unregistered_symbol_is_still_classified});
  tests.push_back({"branch_key_predicate", test_predicate_object_is_classified_as_predicate});
  tests.push_back({"branch_key_unknown_predicate", test_unknown_predicate_is_authoring_error});
  tests.push_back({"branch_key_scalar_literals", test_scalars_are_literals});
  tests.push_back({"branch_key_pair_without_text_head", test_pair_without_text_head_is_literal});
  tests.push_back({"branch_key_range_reference", test_range_reference});
  tests.push_back({"branch_key_object_rejected", test_object_literal_is_rejected});
}
