#include "test_harness.h"
#include "test_utils.h"

#include <atomic>
#include <thread>

#include "arbiter/evaluator.h"

namespace {

void test_shared_tree_across_threads() {
  const arbiter::DecisionTree tree = load_sample_tree("loan_decision");
  const arbiter::Evaluator evaluator(arbiter::default_registry());
  std::atomic<int> mismatches{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&, t]() {
      for (int i = 0; i < 200; ++i) {
        int64_t score = 600 + ((t * 200 + i) % 100);
        arbiter::EvaluationResult result = evaluator.evaluate(
            tree, {{"credit_score", arbiter::make_integer(score)},
                   {"income", arbiter::make_integer(60000)}});
        const char* expected = score < 640 ? "Declined" : "Approved";
        if (result.decision != expected) ++mismatches;
      }
    });
  }
  for (auto& worker : workers) worker.join();
  expect_true(mismatches.load() == 0, "concurrent evaluations agree with sequential ones");
}

}  // namespace

void register_concurrency_tests(std::vector<TestCase>& tests) {
  tests.push_back({"concurrency_shared_tree", test_shared_tree_across_threads});
}
