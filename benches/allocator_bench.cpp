#include "bench_common.hpp"

#include "skillgov/budget/allocator.hpp"
#include "skillgov/observability/global.hpp"

#include <string>
#include <vector>

void run_allocator_benchmarks() {
  skillgov::observability::set_global_observer(nullptr);

  std::vector<std::string> names;
  for (int i = 0; i < 64; ++i) {
    names.push_back("skill-" + std::to_string(i));
  }

  skillgov::budget::BudgetAllocator allocator(
      skillgov::budget::BudgetOptions{.total_budget = 64'000});
  int cursor = 0;
  skillgov::bench::run_bench("allocator_allocate_release", 20'000, [&] {
    const auto &name = names[static_cast<std::size_t>(cursor++ % 64)];
    (void)allocator.allocate(name, 1'500, 1 + cursor % 5);
    (void)allocator.use(name, 200);
    if (cursor % 3 == 0) {
      allocator.release(name);
    }
  });

  skillgov::bench::run_bench("allocator_rebalance_64", 5'000, [&] { (void)allocator.rebalance(); });
}
