#include "test_harness.h"

#include "arbiter/value.h"

namespace {

void test_numeric_equality_crosses_integer_and_real() {
  expect_true(arbiter::values_equal(arbiter::make_integer(5), arbiter::make_real(5.0)),
              "5 == 5.0");
  expect_true(!arbiter::values_equal(arbiter::make_integer(5), arbiter::make_real(5.5)),
              "5 != 5.5");
}

void test_bool_is_not_a_number() {
  expect_true(!arbiter::values_equal(arbiter::make_bool(true), arbiter::make_integer(1)),
              "True is not equal to 1");
  expect_true(arbiter::values_equal(arbiter::make_bool(false), arbiter::make_bool(false)),
              "False equals False");
  expect_true(!arbiter::compare_values(arbiter::make_bool(true), arbiter::make_integer(0))
                   .has_value(),
              "bool is not ordered against integers");
}

void test_compare_values_orders_strings_and_numbers() {
  auto cmp = arbiter::compare_values(arbiter::make_integer(600), arbiter::make_integer(640));
  expect_true(cmp.has_value() && *cmp < 0, "600 < 640");
  cmp = arbiter::compare_values(arbiter::make_real(640.5), arbiter::make_integer(640));
  expect_true(cmp.has_value() && *cmp > 0, "640.5 > 640");
  cmp = arbiter::compare_values(arbiter::make_string("b"), arbiter::make_string("a"));
  expect_true(cmp.has_value() && *cmp > 0, "'b' > 'a'");
  expect_true(!arbiter::compare_values(arbiter::make_string("1"), arbiter::make_integer(1))
                   .has_value(),
              "string and integer are not ordered");
}

void test_display_matches_authored_form() {
  expect_str_eq(arbiter::make_string("US").to_display(), "'US'", "string display");
  expect_str_eq(arbiter::make_bool(true).to_display(), "True", "bool display");
  expect_str_eq(arbiter::make_null().to_display(), "None", "null display");
  expect_str_eq(arbiter::make_integer(600).to_display(), "600", "integer display");
  expect_str_eq(arbiter::make_real(3.0).to_display(), "3.0", "integral real display");
  expect_str_eq(arbiter::make_real(2.5).to_display(), "2.5", "real display");
  expect_str_eq(arbiter::make_list({arbiter::make_string("US"), arbiter::make_string("Canada")})
                    .to_display(),
                "['US', 'Canada']", "list display");
  expect_str_eq(arbiter::make_range(130, 140).to_display(), "range(130, 140)", "range display");
}

void test_to_text_does_not_quote_strings() {
  expect_str_eq(arbiter::make_string("AV Block").to_text(), "AV Block", "string text");
  expect_str_eq(arbiter::make_integer(-7).to_text(), "-7", "integer text");
}

}  // namespace

void register_value_tests(std::vector<TestCase>& tests) {
  tests.push_back({"value_numeric_equality", test_numeric_equality_crosses_integer_and_real});
  tests.push_back({"value_bool_is_not_number", test_bool_is_not_a_number});
  tests.push_back({"value_compare_orders", test_compare_values_orders_strings_and_numbers});
  tests.push_back({"value_display", test_display_matches_authored_form});
  tests.push_back({"value_to_text", test_to_text_does_not_quote_strings});
}
