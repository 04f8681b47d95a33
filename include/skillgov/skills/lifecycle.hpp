#pragma once

#include "skillgov/budget/allocator.hpp"
#include "skillgov/config/schema.hpp"
#include "skillgov/skills/error.hpp"
#include "skillgov/skills/event_log.hpp"
#include "skillgov/skills/source.hpp"
#include "skillgov/skills/state.hpp"
#include "skillgov/skills/version.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace skillgov::skills {

struct LifecycleOptions {
  std::size_t max_loaded_skills = 20;
  std::size_t max_active_skills = 5;
  std::uint64_t context_budget = 10'000;
  std::uint64_t default_allocation = 2'000;
  /// Zero waits for the source indefinitely.
  std::chrono::milliseconds fetch_timeout{0};
  bool allow_over_budget = false;

  [[nodiscard]] static LifecycleOptions from_config(const config::LifecycleConfig &config);
};

struct LoadOptions {
  std::optional<std::string> version;
  std::optional<std::chrono::milliseconds> timeout;
  std::stop_token stop;
};

struct SkillSnapshot {
  std::string name;
  SkillState state = SkillState::Discovered;
  std::optional<Version> version;
  std::uint64_t allocation = 0;
  std::optional<int> priority;
};

using LoadHook = std::function<void(const std::string &skill_name, const std::string &content)>;
using UnloadHook = std::function<void(const std::string &skill_name)>;
using ErrorHook = std::function<void(const std::string &skill_name, const SkillError &error)>;

// Source fetches run without mutex_ held. Hooks run after it is released.
class LifecycleManager {
public:
  explicit LifecycleManager(std::shared_ptr<ISkillSource> source, LifecycleOptions options = {},
                            std::shared_ptr<budget::BudgetAllocator> allocator = nullptr);

  LifecycleManager(const LifecycleManager &) = delete;
  LifecycleManager &operator=(const LifecycleManager &) = delete;

  SkillResult<std::vector<std::string>> discover();

  SkillStatus load(const std::string &skill_name, const LoadOptions &options = {});
  SkillStatus unload(const std::string &skill_name);

  SkillResult<std::string> activate(const std::string &skill_name,
                                    std::optional<std::uint64_t> allocation = std::nullopt);

  /// The allocation is granted by the attached BudgetAllocator at `priority`.
  SkillResult<std::string> activate_with_priority(const std::string &skill_name,
                                                  std::uint64_t allocation, int priority);

  SkillStatus deactivate(const std::string &skill_name);

  SkillStatus upgrade(const std::string &skill_name, const std::string &target_version);

  /// Returns to the version recorded by the `steps`-th most recent upgrade.
  SkillStatus rollback(const std::string &skill_name, std::size_t steps = 1);

  [[nodiscard]] SkillState get_state(const std::string &skill_name) const;
  [[nodiscard]] std::optional<Version> get_version(const std::string &skill_name) const;
  [[nodiscard]] std::map<std::string, std::uint64_t> get_context_usage() const;
  [[nodiscard]] std::uint64_t get_available_budget() const;
  [[nodiscard]] std::vector<LifecycleEvent>
  get_events(const std::optional<std::string> &skill_name = std::nullopt) const;
  [[nodiscard]] std::vector<SkillSnapshot> list_skills() const;
  [[nodiscard]] std::size_t loaded_count() const;
  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] const LifecycleOptions &options() const { return options_; }

  void on_load(LoadHook hook);
  void on_unload(UnloadHook hook);
  void on_error(ErrorHook hook);

private:
  struct SkillSlot {
    SkillState state = SkillState::Discovered;
    std::optional<Version> version;
    std::optional<std::string> content;
    std::uint64_t allocation = 0;
    // Sequence of the activate event that began the current active period.
    std::uint64_t active_since = 0;
    std::optional<int> delegated_priority;
  };

  enum class HookKind { Load, Unload, Error };

  struct HookCall {
    HookKind kind = HookKind::Load;
    std::string skill_name;
    std::string content;
    SkillError error;
  };

  SkillResult<std::string> activate_impl(const std::string &skill_name,
                                         std::optional<std::uint64_t> allocation,
                                         std::optional<int> priority);
  SkillResult<FetchedSkill> fetch_from_source(const std::string &skill_name,
                                              const std::optional<std::string> &version,
                                              const LoadOptions &options) const;

  SkillSlot &slot_locked(const std::string &skill_name);
  [[nodiscard]] SkillState state_locked(const std::string &skill_name) const;
  [[nodiscard]] std::size_t count_locked(bool active_only) const;
  [[nodiscard]] std::uint64_t allocation_locked(const std::string &skill_name,
                                                const SkillSlot &slot) const;
  [[nodiscard]] std::uint64_t active_usage_locked() const;
  [[nodiscard]] std::optional<std::string> oldest_active_locked(const std::string &exclude) const;

  SkillStatus commit_load_locked(const std::string &skill_name,
                                 SkillResult<FetchedSkill> fetched,
                                 const std::optional<std::string> &requested_version,
                                 std::vector<HookCall> &hooks);
  SkillStatus fail_locked(const std::string &skill_name, LifecycleEventType type,
                          const SkillError &error, bool enter_error_state,
                          std::vector<HookCall> &hooks);
  void install_locked(const std::string &skill_name, FetchedSkill fetched, const Version &version,
                      std::vector<HookCall> &hooks);
  void ensure_load_capacity_locked(const std::string &incoming, std::vector<HookCall> &hooks);
  void unload_locked(const std::string &skill_name, const std::string &reason,
                     std::vector<HookCall> &hooks);
  void deactivate_locked(const std::string &skill_name, const std::string &reason);
  SkillResult<std::string> activate_locked(const std::string &skill_name,
                                           std::optional<std::uint64_t> allocation,
                                           std::optional<int> priority);
  SkillStatus commit_upgrade_locked(const std::string &skill_name, const Version &target,
                                    SkillResult<FetchedSkill> fetched,
                                    std::vector<HookCall> &hooks);
  std::uint64_t record_locked(const std::string &skill_name, LifecycleEventType type,
                              SkillState old_state, SkillState new_state,
                              const std::optional<Version> &version, EventMetadata metadata = {});

  void dispatch_hooks(const std::vector<HookCall> &calls);
  void report_hook_failure(const HookCall &call, const std::string &what);
  void publish_metrics() const;

  const std::shared_ptr<ISkillSource> source_;
  const LifecycleOptions options_;
  const std::shared_ptr<budget::BudgetAllocator> allocator_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, SkillSlot> skills_;
  std::vector<std::string> registration_order_;
  EventLog events_;

  mutable std::mutex hooks_mutex_;
  std::vector<LoadHook> load_hooks_;
  std::vector<UnloadHook> unload_hooks_;
  std::vector<ErrorHook> error_hooks_;
};

} // namespace skillgov::skills
