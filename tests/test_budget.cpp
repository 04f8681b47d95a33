#include "test_framework.hpp"

#include "skillgov/budget/allocator.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <thread>
#include <variant>

namespace {

skillgov::budget::BudgetOptions pool(const std::uint64_t total) {
  skillgov::budget::BudgetOptions options;
  options.total_budget = total;
  return options;
}

} // namespace

void register_budget_tests(std::vector<skillgov::tests::TestCase> &tests) {
  using skillgov::tests::require;
  namespace bg = skillgov::budget;

  tests.push_back({"budget_record_derived_fields", [] {
                     bg::BudgetRecord record{.skill_name = "s", .allocated = 400, .used = 100};
                     require(record.remaining() == 300, "remaining should be 300");
                     require(record.utilization() == 0.25, "utilization should be 0.25");

                     bg::BudgetRecord empty{.skill_name = "e"};
                     require(empty.utilization() == 0.0, "zero allocation has zero utilization");
                     require(empty.remaining() == 0, "zero allocation has nothing remaining");
                   }});

  tests.push_back({"budget_allocate_caps_at_pool_without_reclaim_for_priority_one", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     require(allocator.allocate("reflection", 2'000, 2) == 2'000,
                             "first grant should be whole");
                     require(allocator.allocate("synthesis", 9'000, 1) == 8'000,
                             "priority 1 should be capped by the pool");
                     const auto reflection = allocator.get_budget("reflection");
                     require(reflection.has_value() && reflection->allocated == 2'000,
                             "priority 1 must not reclaim");
                     require(allocator.get_available() == 0, "pool should be exhausted");
                   }});

  tests.push_back({"budget_high_priority_reclaims_lowest_priority_first", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     allocator.allocate("background", 4'000, 1);
                     allocator.allocate("normal", 6'000, 2);
                     require(allocator.use("background", 1'000), "use should succeed");

                     const auto granted = allocator.allocate("urgent", 3'500, 3);
                     require(granted == 3'500, "urgent should be fully funded, got " +
                                                   std::to_string(granted));
                     // background has 3000 unused and is drained first, normal covers the rest.
                     require(allocator.get_budget("background")->allocated == 1'000,
                             "background should keep only its used tokens");
                     require(allocator.get_budget("background")->used == 1'000,
                             "reclaim must never touch used");
                     require(allocator.get_budget("normal")->allocated == 5'500,
                             "normal should give up the remaining 500");
                     require(allocator.get_total_allocated() <= allocator.total_budget(),
                             "pool must be conserved");
                   }});

  tests.push_back({"budget_reclaim_skips_equal_and_higher_priorities", [] {
                     bg::BudgetAllocator allocator(pool(1'000));
                     allocator.allocate("peer", 600, 2);
                     allocator.allocate("boss", 400, 5);
                     const auto granted = allocator.allocate("contender", 500, 2);
                     require(granted == 0, "no lower-priority holder exists");
                     require(allocator.get_budget("peer")->allocated == 600, "peer untouched");
                     require(allocator.get_budget("boss")->allocated == 400, "boss untouched");
                     require(allocator.get_budget("contender").has_value(),
                             "a zero grant still records the request");
                   }});

  tests.push_back({"budget_reallocation_replaces_previous_record", [] {
                     bg::BudgetAllocator allocator(pool(1'000));
                     allocator.allocate("s", 800);
                     require(allocator.use("s", 300), "use should succeed");
                     require(allocator.allocate("s", 1'000) == 1'000,
                             "own previous grant should not count against the pool");
                     const auto record = allocator.get_budget("s");
                     require(record->used == 0, "new record starts unused");
                     require(allocator.get_total_allocated() == 1'000, "single record expected");
                   }});

  tests.push_back({"budget_use_rejects_overdraw_without_mutation", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     allocator.allocate("x", 100);
                     require(!allocator.use("x", 150), "overdraw should be rejected");
                     require(allocator.get_budget("x")->used == 0, "used must stay 0");
                     require(allocator.use("x", 100), "exact remaining should be accepted");
                     require(!allocator.use("x", 1), "nothing left");
                     require(!allocator.use("unknown", 1), "unknown skill should be rejected");
                   }});

  tests.push_back({"budget_release_records_usage_history", [] {
                     auto options = pool(1'000);
                     options.usage_history_limit = 2;
                     bg::BudgetAllocator allocator(options);
                     for (const auto *name : {"a", "b", "c"}) {
                       allocator.allocate(name, 100);
                       require(allocator.use(name, 25), "use should succeed");
                       require(allocator.release(name), "release should succeed");
                     }
                     require(!allocator.release("a"), "double release should report false");

                     const auto history = allocator.get_usage_history();
                     require(history.size() == 2, "history should be bounded");
                     require(history.front().skill_name == "b", "oldest entry dropped first");
                     require(history.back().utilization == 0.25, "utilization captured");
                     require(allocator.get_total_allocated() == 0, "all records released");
                   }});

  tests.push_back({"budget_rebalance_shrinks_underused", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     allocator.allocate("skill1", 2'000);
                     require(allocator.use("skill1", 200), "use should succeed");
                     const auto report = allocator.rebalance();
                     require(allocator.get_budget("skill1")->allocated == 1'400,
                             "2000 at 10% utilization should shrink to 1400");
                     require(report.shrunk == 1 && report.expanded == 0, "report counts");
                   }});

  tests.push_back({"budget_rebalance_expands_saturated_and_leaves_middle_band", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     allocator.allocate("hot", 1'000);
                     allocator.allocate("steady", 1'000);
                     require(allocator.use("hot", 950), "use hot");
                     require(allocator.use("steady", 500), "use steady");

                     allocator.rebalance();
                     // available = 8000, expansion = min(4000, 1000).
                     require(allocator.get_budget("hot")->allocated == 2'000,
                             "saturated record should double");
                     require(allocator.get_budget("steady")->allocated == 1'000,
                             "middle band should be untouched");
                     require(allocator.get_total_allocated() <= allocator.total_budget(),
                             "pool must be conserved");
                   }});

  tests.push_back({"budget_rebalance_expansion_bounded_by_half_available", [] {
                     bg::BudgetAllocator allocator(pool(1'000));
                     allocator.allocate("hot", 800);
                     require(allocator.use("hot", 790), "use hot");
                     allocator.rebalance();
                     require(allocator.get_budget("hot")->allocated == 900,
                             "expansion should be half of the 200 free tokens");
                   }});

  tests.push_back({"budget_grants_are_reported_to_observer", [] {
                     skillgov::testing::ObserverScope scope;
                     bg::BudgetAllocator allocator(pool(100));
                     allocator.allocate("low", 100, 1);
                     allocator.allocate("high", 60, 2);

                     bool saw_reclaim = false;
                     for (const auto &event : scope.observer().events()) {
                       if (const auto *grant =
                               std::get_if<skillgov::observability::BudgetGrantEvent>(&event);
                           grant != nullptr && grant->skill == "high") {
                         saw_reclaim = grant->reclaimed == 60 && grant->granted == 60;
                       }
                     }
                     require(saw_reclaim, "grant event should report the reclaim");
                   }});

  tests.push_back({"budget_concurrent_reclaims_never_double_spend", [] {
                     bg::BudgetAllocator allocator(pool(10'000));
                     allocator.allocate("victim", 10'000, 1);

                     std::vector<std::thread> threads;
                     std::vector<std::uint64_t> grants(8, 0);
                     for (std::size_t i = 0; i < grants.size(); ++i) {
                       threads.emplace_back([&allocator, &grants, i] {
                         grants[i] = allocator.allocate("taker-" + std::to_string(i), 2'000, 5);
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }

                     std::uint64_t granted = 0;
                     for (const auto grant : grants) {
                       granted += grant;
                     }
                     require(granted == 10'000, "exactly the victim's pool should be handed out");
                     require(allocator.get_budget("victim")->allocated == 0,
                             "victim should be fully drained");
                     require(allocator.get_total_allocated() == 10'000,
                             "sum of allocations must equal the pool");
                   }});

  tests.push_back({"budget_conservation_under_mixed_operations", [] {
                     bg::BudgetAllocator allocator(pool(5'000));
                     std::atomic<bool> exceeded{false};
                     std::vector<std::thread> threads;
                     for (int t = 0; t < 4; ++t) {
                       threads.emplace_back([&allocator, &exceeded, t] {
                         for (int i = 0; i < 200; ++i) {
                           const std::string name = "s" + std::to_string((t * 7 + i) % 10);
                           switch (i % 4) {
                           case 0:
                             allocator.allocate(name, 900, 1 + (i % 3));
                             break;
                           case 1:
                             (void)allocator.use(name, 100);
                             break;
                           case 2:
                             allocator.rebalance();
                             break;
                           default:
                             allocator.release(name);
                             break;
                           }
                           if (allocator.get_total_allocated() > 5'000) {
                             exceeded = true;
                           }
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(!exceeded.load(), "pool exceeded between operations");
                     require(allocator.get_total_allocated() <= 5'000, "pool must be conserved");
                   }});
}
