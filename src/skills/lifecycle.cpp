#include "skillgov/skills/lifecycle.hpp"

#include "skillgov/common/hash.hpp"
#include "skillgov/observability/global.hpp"

#include <condition_variable>
#include <exception>
#include <limits>
#include <thread>
#include <utility>

namespace skillgov::skills {

namespace {

constexpr const char *kComponent = "skills.lifecycle";

SkillResult<FetchedSkill> invoke_source(ISkillSource &source, const FetchRequest &request) {
  try {
    return source.fetch(request);
  } catch (const std::exception &ex) {
    return SkillResult<FetchedSkill>::failure(make_error(
        SkillErrorCode::UnexpectedFault, std::string(source.name()) + " fetch threw: " + ex.what()));
  }
}

struct PendingFetch {
  std::mutex mutex;
  std::condition_variable_any cv;
  bool complete = false;
  std::optional<SkillResult<FetchedSkill>> result;
};

std::optional<std::string> version_string(const std::optional<Version> &version) {
  if (!version.has_value()) {
    return std::nullopt;
  }
  return version->to_string();
}

} // namespace

LifecycleOptions LifecycleOptions::from_config(const config::LifecycleConfig &config) {
  LifecycleOptions options;
  options.max_loaded_skills = static_cast<std::size_t>(config.max_loaded_skills);
  options.max_active_skills = static_cast<std::size_t>(config.max_active_skills);
  options.context_budget = config.context_budget;
  options.default_allocation = config.default_allocation;
  options.fetch_timeout =
      std::chrono::milliseconds(static_cast<std::int64_t>(config.fetch_timeout_ms));
  options.allow_over_budget = config.over_budget == "allow";
  return options;
}

LifecycleManager::LifecycleManager(std::shared_ptr<ISkillSource> source, LifecycleOptions options,
                                   std::shared_ptr<budget::BudgetAllocator> allocator)
    : source_(std::move(source)), options_(std::move(options)), allocator_(std::move(allocator)) {}

SkillResult<FetchedSkill>
LifecycleManager::fetch_from_source(const std::string &skill_name,
                                    const std::optional<std::string> &version,
                                    const LoadOptions &options) const {
  if (!source_) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::UnexpectedFault, "no skill source configured"));
  }
  if (options.stop.stop_requested()) {
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::Cancelled, "load cancelled: " + skill_name));
  }

  const auto timeout = options.timeout.value_or(options_.fetch_timeout);
  if (timeout.count() <= 0) {
    return invoke_source(*source_, FetchRequest{
                                       .name = skill_name, .version = version, .stop = options.stop});
  }

  // The worker owns its own stop source so a timed-out fetch is told to give
  // up even when the caller never asked for cancellation.
  std::stop_source worker_stop;
  std::stop_callback forward_cancel(options.stop, [worker_stop]() mutable {
    worker_stop.request_stop();
  });

  auto pending = std::make_shared<PendingFetch>();
  std::thread([source = source_, pending,
               request = FetchRequest{.name = skill_name,
                                      .version = version,
                                      .stop = worker_stop.get_token()}]() {
    auto result = invoke_source(*source, request);
    {
      std::lock_guard<std::mutex> lock(pending->mutex);
      pending->result.emplace(std::move(result));
      pending->complete = true;
    }
    pending->cv.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lock(pending->mutex);
  const bool done =
      pending->cv.wait_for(lock, options.stop, timeout, [&]() { return pending->complete; });
  if (!done) {
    worker_stop.request_stop();
    if (options.stop.stop_requested()) {
      return SkillResult<FetchedSkill>::failure(
          make_error(SkillErrorCode::Cancelled, "load cancelled: " + skill_name));
    }
    return SkillResult<FetchedSkill>::failure(
        make_error(SkillErrorCode::Timeout, "fetching " + skill_name + " timed out after " +
                                                std::to_string(timeout.count()) + "ms"));
  }
  return std::move(*pending->result);
}

LifecycleManager::SkillSlot &LifecycleManager::slot_locked(const std::string &skill_name) {
  auto [it, inserted] = skills_.try_emplace(skill_name);
  if (inserted) {
    registration_order_.push_back(skill_name);
  }
  return it->second;
}

SkillState LifecycleManager::state_locked(const std::string &skill_name) const {
  const auto it = skills_.find(skill_name);
  return it == skills_.end() ? SkillState::Discovered : it->second.state;
}

std::size_t LifecycleManager::count_locked(const bool active_only) const {
  std::size_t count = 0;
  for (const auto &[name, slot] : skills_) {
    (void)name;
    if (active_only ? slot.state == SkillState::Active : is_resident(slot.state)) {
      ++count;
    }
  }
  return count;
}

std::uint64_t LifecycleManager::allocation_locked(const std::string &skill_name,
                                                  const SkillSlot &slot) const {
  if (slot.state != SkillState::Active) {
    return 0;
  }
  // Delegated grants can shrink behind our back (reclaim, rebalance).
  if (slot.delegated_priority.has_value() && allocator_) {
    const auto record = allocator_->get_budget(skill_name);
    return record.has_value() ? record->allocated : 0;
  }
  return slot.allocation;
}

std::uint64_t LifecycleManager::active_usage_locked() const {
  std::uint64_t used = 0;
  for (const auto &[name, slot] : skills_) {
    used += allocation_locked(name, slot);
  }
  return used;
}

std::optional<std::string>
LifecycleManager::oldest_active_locked(const std::string &exclude) const {
  std::optional<std::string> oldest;
  std::uint64_t oldest_since = std::numeric_limits<std::uint64_t>::max();
  for (const auto &[name, slot] : skills_) {
    if (slot.state == SkillState::Active && name != exclude && slot.active_since < oldest_since) {
      oldest = name;
      oldest_since = slot.active_since;
    }
  }
  return oldest;
}

std::uint64_t LifecycleManager::record_locked(const std::string &skill_name,
                                              const LifecycleEventType type,
                                              const SkillState old_state,
                                              const SkillState new_state,
                                              const std::optional<Version> &version,
                                              EventMetadata metadata) {
  const auto version_text = version_string(version);
  const auto sequence = events_.append(skill_name, type, old_state, new_state, version_text,
                                       std::move(metadata));
  observability::record_skill_transition(
      skill_name, std::string(lifecycle_event_type_to_string(type)),
      std::string(skill_state_to_string(old_state)), std::string(skill_state_to_string(new_state)),
      version_text.value_or(""));
  return sequence;
}

SkillStatus LifecycleManager::fail_locked(const std::string &skill_name,
                                          const LifecycleEventType type, const SkillError &error,
                                          const bool enter_error_state,
                                          std::vector<HookCall> &hooks) {
  auto &slot = slot_locked(skill_name);
  const SkillState old_state = slot.state;
  if (enter_error_state) {
    slot.state = SkillState::Error;
    slot.content.reset();
    slot.allocation = 0;
    slot.delegated_priority.reset();
  }
  record_locked(skill_name, type, old_state, slot.state, slot.version,
                {{"code", std::string(skill_error_code_to_string(error.code))},
                 {"error", error.message}});
  observability::record_error(kComponent, skill_name + ": " + error.to_string());
  hooks.push_back(HookCall{.kind = HookKind::Error, .skill_name = skill_name, .error = error});
  return SkillStatus::failure(error);
}

void LifecycleManager::ensure_load_capacity_locked(const std::string &incoming,
                                                   std::vector<HookCall> &hooks) {
  while (options_.max_loaded_skills > 0 && count_locked(false) >= options_.max_loaded_skills) {
    std::optional<std::string> victim;
    for (const auto &name : registration_order_) {
      if (name != incoming && skills_.at(name).state == SkillState::Loaded) {
        victim = name;
        break;
      }
    }
    if (!victim.has_value()) {
      victim = oldest_active_locked(incoming);
    }
    if (!victim.has_value()) {
      return;
    }
    unload_locked(*victim, "capacity", hooks);
  }
}

void LifecycleManager::install_locked(const std::string &skill_name, FetchedSkill fetched,
                                      const Version &version, std::vector<HookCall> &hooks) {
  ensure_load_capacity_locked(skill_name, hooks);

  auto &slot = slot_locked(skill_name);
  const SkillState old_state = slot.state;
  EventMetadata metadata{{"digest", common::sha256_hex(fetched.content)}};
  if (!fetched.origin.empty()) {
    metadata["origin"] = fetched.origin;
  }

  slot.state = SkillState::Loaded;
  slot.version = version;
  slot.content = fetched.content;
  slot.allocation = 0;
  slot.active_since = 0;
  slot.delegated_priority.reset();

  record_locked(skill_name, LifecycleEventType::Load, old_state, SkillState::Loaded, version,
                std::move(metadata));
  hooks.push_back(HookCall{
      .kind = HookKind::Load, .skill_name = skill_name, .content = std::move(fetched.content)});
}

SkillStatus LifecycleManager::commit_load_locked(const std::string &skill_name,
                                                 SkillResult<FetchedSkill> fetched,
                                                 const std::optional<std::string> &requested_version,
                                                 std::vector<HookCall> &hooks) {
  // Another caller may have finished loading while we were fetching.
  if (is_resident(state_locked(skill_name))) {
    return SkillStatus::success();
  }
  if (!fetched.ok()) {
    return fail_locked(skill_name, LifecycleEventType::LoadError, fetched.error(), true, hooks);
  }

  auto &skill = fetched.value();
  std::string version_text = skill.declared_version;
  if (version_text.empty() && requested_version.has_value()) {
    version_text = *requested_version;
  }

  Version version = version_from_content(skill.content);
  if (!version_text.empty()) {
    const auto parsed = Version::parse(version_text);
    if (!parsed.ok()) {
      return fail_locked(skill_name, LifecycleEventType::LoadError,
                         make_error(SkillErrorCode::InvalidVersion, parsed.error()), true, hooks);
    }
    version = parsed.value();
  }

  install_locked(skill_name, std::move(skill), version, hooks);
  return SkillStatus::success();
}

void LifecycleManager::deactivate_locked(const std::string &skill_name,
                                         const std::string &reason) {
  auto &slot = skills_.at(skill_name);
  if (slot.state != SkillState::Active) {
    return;
  }

  const std::uint64_t freed = allocation_locked(skill_name, slot);
  if (slot.delegated_priority.has_value() && allocator_) {
    allocator_->release(skill_name);
  }
  slot.state = SkillState::Loaded;
  slot.allocation = 0;
  slot.active_since = 0;
  slot.delegated_priority.reset();

  record_locked(skill_name, LifecycleEventType::Deactivate, SkillState::Active,
                SkillState::Loaded, slot.version,
                {{"freed_allocation", std::to_string(freed)}, {"reason", reason}});
}

void LifecycleManager::unload_locked(const std::string &skill_name, const std::string &reason,
                                     std::vector<HookCall> &hooks) {
  deactivate_locked(skill_name, reason);

  auto &slot = skills_.at(skill_name);
  const SkillState old_state = slot.state;
  slot.state = SkillState::Unloaded;
  slot.content.reset();

  record_locked(skill_name, LifecycleEventType::Unload, old_state, SkillState::Unloaded,
                slot.version, {{"reason", reason}});
  hooks.push_back(HookCall{.kind = HookKind::Unload, .skill_name = skill_name});
}

SkillResult<std::string> LifecycleManager::activate_locked(const std::string &skill_name,
                                                           std::optional<std::uint64_t> allocation,
                                                           std::optional<int> priority) {
  const auto it = skills_.find(skill_name);
  if (it == skills_.end() || !is_resident(it->second.state)) {
    return SkillResult<std::string>::failure(make_error(
        SkillErrorCode::NotResident, skill_name + " was unloaded before it could be activated"));
  }
  auto &slot = it->second;
  const bool was_active = slot.state == SkillState::Active;
  const std::uint64_t current = allocation_locked(skill_name, slot);

  if (was_active) {
    const bool same_allocation = !allocation.has_value() || *allocation == current;
    const bool same_priority = !priority.has_value() || priority == slot.delegated_priority;
    if (same_allocation && same_priority) {
      return SkillResult<std::string>::success(*slot.content);
    }
  }

  std::uint64_t wanted = allocation.value_or(options_.default_allocation);
  if (wanted > options_.context_budget && !options_.allow_over_budget) {
    return SkillResult<std::string>::failure(make_error(
        SkillErrorCode::BudgetExceeded,
        skill_name + " requests " + std::to_string(wanted) + " tokens, context budget is " +
            std::to_string(options_.context_budget)));
  }

  // The grant comes first: a refused grant must leave other skills untouched.
  if (priority.has_value()) {
    const std::uint64_t granted = allocator_->allocate(skill_name, wanted, *priority);
    if (granted == 0 && wanted > 0) {
      allocator_->release(skill_name);
      if (was_active) {
        // The previous grant was replaced; the skill cannot stay active without one.
        deactivate_locked(skill_name, "budget_exhausted");
      }
      return SkillResult<std::string>::failure(
          make_error(SkillErrorCode::BudgetExceeded,
                     "budget pool has no tokens for " + skill_name + " at priority " +
                         std::to_string(*priority)));
    }
    wanted = granted;
  } else if (slot.delegated_priority.has_value() && allocator_) {
    allocator_->release(skill_name);
  }
  slot.delegated_priority = priority;

  if (!was_active && options_.max_active_skills > 0) {
    while (count_locked(true) >= options_.max_active_skills) {
      const auto oldest = oldest_active_locked(skill_name);
      if (!oldest.has_value()) {
        break;
      }
      deactivate_locked(*oldest, "active_limit");
    }
  }

  // Headroom excludes this skill's own allocation when resizing.
  const auto others = [&]() { return active_usage_locked() - allocation_locked(skill_name, slot); };
  while (others() + wanted > options_.context_budget) {
    const auto oldest = oldest_active_locked(skill_name);
    if (!oldest.has_value()) {
      break;
    }
    deactivate_locked(*oldest, "context_budget");
  }
  if (others() + wanted > options_.context_budget) {
    observability::record_error(kComponent, skill_name + " activated over context budget (" +
                                                std::to_string(others() + wanted) + " > " +
                                                std::to_string(options_.context_budget) + ")");
  }

  const SkillState old_state = slot.state;
  slot.state = SkillState::Active;
  slot.allocation = wanted;

  EventMetadata metadata{{"context_allocation", std::to_string(wanted)}};
  if (priority.has_value()) {
    metadata["priority"] = std::to_string(*priority);
  }
  if (was_active) {
    metadata["resized_from"] = std::to_string(current);
  }
  const auto sequence = record_locked(skill_name, LifecycleEventType::Activate, old_state,
                                      SkillState::Active, slot.version, std::move(metadata));
  if (!was_active) {
    slot.active_since = sequence;
  }
  return SkillResult<std::string>::success(*slot.content);
}

SkillStatus LifecycleManager::commit_upgrade_locked(const std::string &skill_name,
                                                    const Version &target,
                                                    SkillResult<FetchedSkill> fetched,
                                                    std::vector<HookCall> &hooks) {
  auto &slot = slot_locked(skill_name);
  const auto previous = slot.version;

  if (!fetched.ok()) {
    return fail_locked(skill_name, LifecycleEventType::UpgradeError, fetched.error(), false,
                       hooks);
  }

  auto &skill = fetched.value();
  Version resolved = target;
  if (!skill.declared_version.empty()) {
    const auto parsed = Version::parse(skill.declared_version);
    if (!parsed.ok()) {
      return fail_locked(skill_name, LifecycleEventType::UpgradeError,
                         make_error(SkillErrorCode::InvalidVersion, parsed.error()), false, hooks);
    }
    resolved = parsed.value();
  }
  if (resolved != target) {
    return fail_locked(skill_name, LifecycleEventType::UpgradeError,
                       make_error(SkillErrorCode::InvalidVersion,
                                  "source returned " + resolved.to_string() + " for requested " +
                                      target.to_string()),
                       false, hooks);
  }
  // Re-checked here: another upgrade may have landed while we were fetching.
  if (previous.has_value() && !previous->compatible(target)) {
    return fail_locked(skill_name, LifecycleEventType::UpgradeError,
                       make_error(SkillErrorCode::IncompatibleVersion,
                                  "incompatible version upgrade: " + previous->to_string() +
                                      " -> " + target.to_string() +
                                      "; major version must match"),
                       false, hooks);
  }

  const SkillState old_state = slot.state;
  const bool was_active = old_state == SkillState::Active;
  const std::uint64_t allocation = allocation_locked(skill_name, slot);
  const auto priority = slot.delegated_priority;

  if (is_resident(old_state)) {
    unload_locked(skill_name, "upgrade", hooks);
  }
  install_locked(skill_name, std::move(skill), target, hooks);

  std::optional<SkillError> reactivation_error;
  if (was_active) {
    auto activated = activate_locked(skill_name, allocation, priority);
    if (!activated.ok()) {
      reactivation_error = activated.error();
    }
  }

  EventMetadata metadata;
  if (previous.has_value()) {
    metadata["from_version"] = previous->to_string();
  }
  metadata["to_version"] = target.to_string();
  record_locked(skill_name, LifecycleEventType::Upgrade, old_state, slot.state, target,
                std::move(metadata));

  if (reactivation_error.has_value()) {
    observability::record_error(kComponent, skill_name + " upgraded but not reactivated: " +
                                                reactivation_error->to_string());
    return SkillStatus::failure(*reactivation_error);
  }
  return SkillStatus::success();
}

void LifecycleManager::on_load(LoadHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  load_hooks_.push_back(std::move(hook));
}

void LifecycleManager::on_unload(UnloadHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  unload_hooks_.push_back(std::move(hook));
}

void LifecycleManager::on_error(ErrorHook hook) {
  std::lock_guard<std::mutex> lock(hooks_mutex_);
  error_hooks_.push_back(std::move(hook));
}

void LifecycleManager::dispatch_hooks(const std::vector<HookCall> &calls) {
  if (calls.empty()) {
    return;
  }

  std::vector<LoadHook> load_hooks;
  std::vector<UnloadHook> unload_hooks;
  std::vector<ErrorHook> error_hooks;
  {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    load_hooks = load_hooks_;
    unload_hooks = unload_hooks_;
    error_hooks = error_hooks_;
  }

  for (const auto &call : calls) {
    const auto run = [&](const auto &hook, auto &&...args) {
      try {
        hook(args...);
      } catch (const std::exception &ex) {
        report_hook_failure(call, ex.what());
      } catch (...) {
        report_hook_failure(call, "unknown exception");
      }
    };

    switch (call.kind) {
    case HookKind::Load:
      for (const auto &hook : load_hooks) {
        run(hook, call.skill_name, call.content);
      }
      break;
    case HookKind::Unload:
      for (const auto &hook : unload_hooks) {
        run(hook, call.skill_name);
      }
      break;
    case HookKind::Error:
      for (const auto &hook : error_hooks) {
        run(hook, call.skill_name, call.error);
      }
      break;
    }
  }
}

void LifecycleManager::report_hook_failure(const HookCall &call, const std::string &what) {
  const char *hook_name = call.kind == HookKind::Load     ? "on_load"
                          : call.kind == HookKind::Unload ? "on_unload"
                                                          : "on_error";
  const SkillError error =
      make_error(SkillErrorCode::UnexpectedFault, std::string(hook_name) + " hook failed: " + what);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    const SkillState state = state_locked(call.skill_name);
    const auto it = skills_.find(call.skill_name);
    record_locked(call.skill_name, LifecycleEventType::HookError, state, state,
                  it == skills_.end() ? std::nullopt : it->second.version,
                  {{"hook", hook_name}, {"error", what}});
  }
  observability::record_error(kComponent, call.skill_name + ": " + error.message);

  // A failing error hook is only logged, never fed back into the error hooks.
  if (call.kind == HookKind::Error) {
    return;
  }
  std::vector<ErrorHook> error_hooks;
  {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    error_hooks = error_hooks_;
  }
  for (const auto &hook : error_hooks) {
    try {
      hook(call.skill_name, error);
    } catch (const std::exception &ex) {
      observability::record_error(kComponent, call.skill_name +
                                                  ": on_error hook failed: " + ex.what());
    } catch (...) {
      observability::record_error(kComponent,
                                  call.skill_name + ": on_error hook failed: unknown exception");
    }
  }
}

void LifecycleManager::publish_metrics() const {
  std::uint64_t active = 0;
  std::uint64_t loaded = 0;
  std::uint64_t used = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active = count_locked(true);
    loaded = count_locked(false);
    used = active_usage_locked();
  }
  observability::record_metric(observability::ActiveSkillsMetric{.count = active});
  observability::record_metric(observability::LoadedSkillsMetric{.count = loaded});
  observability::record_metric(
      observability::ContextUsageMetric{.used = used, .budget = options_.context_budget});
}

SkillResult<std::vector<std::string>> LifecycleManager::discover() {
  using ListResult = SkillResult<std::vector<std::string>>;
  if (!source_) {
    return ListResult::failure(
        make_error(SkillErrorCode::UnexpectedFault, "no skill source configured"));
  }

  common::Result<std::vector<std::string>> listed =
      common::Result<std::vector<std::string>>::failure("");
  try {
    listed = source_->list();
  } catch (const std::exception &ex) {
    return ListResult::failure(make_error(SkillErrorCode::UnexpectedFault,
                                          std::string(source_->name()) + " list threw: " +
                                              ex.what()));
  }
  if (!listed.ok()) {
    observability::record_error(kComponent, "discover failed: " + listed.error());
    return ListResult::failure(make_error(SkillErrorCode::UnexpectedFault, listed.error()));
  }

  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &name : listed.value()) {
      if (!is_valid_skill_name(name)) {
        continue;
      }
      names.push_back(name);
      if (!skills_.contains(name)) {
        slot_locked(name);
        record_locked(name, LifecycleEventType::Discover, SkillState::Discovered,
                      SkillState::Discovered, std::nullopt,
                      {{"source", std::string(source_->name())}});
      }
    }
  }
  return ListResult::success(std::move(names));
}

SkillStatus LifecycleManager::load(const std::string &skill_name, const LoadOptions &options) {
  if (!is_valid_skill_name(skill_name)) {
    return SkillStatus::failure(
        make_error(SkillErrorCode::InvalidRequest, "invalid skill name: '" + skill_name + "'"));
  }
  std::optional<std::string> requested_version;
  if (options.version.has_value()) {
    const auto parsed = Version::parse(*options.version);
    if (!parsed.ok()) {
      return SkillStatus::failure(make_error(SkillErrorCode::InvalidVersion, parsed.error()));
    }
    requested_version = parsed.value().to_string();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_resident(state_locked(skill_name))) {
      return SkillStatus::success();
    }
  }

  auto fetched = fetch_from_source(skill_name, requested_version, options);

  std::vector<HookCall> hooks;
  SkillStatus status = SkillStatus::success();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = commit_load_locked(skill_name, std::move(fetched), requested_version, hooks);
  }
  dispatch_hooks(hooks);
  publish_metrics();
  return status;
}

SkillStatus LifecycleManager::unload(const std::string &skill_name) {
  std::vector<HookCall> hooks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const SkillState state = state_locked(skill_name);
    if (state == SkillState::Discovered) {
      return SkillStatus::failure(
          make_error(SkillErrorCode::InvalidRequest, skill_name + " has never been loaded"));
    }
    if (state == SkillState::Unloaded) {
      return SkillStatus::success();
    }
    unload_locked(skill_name, "requested", hooks);
  }
  dispatch_hooks(hooks);
  publish_metrics();
  return SkillStatus::success();
}

SkillResult<std::string> LifecycleManager::activate(const std::string &skill_name,
                                                    const std::optional<std::uint64_t> allocation) {
  return activate_impl(skill_name, allocation, std::nullopt);
}

SkillResult<std::string> LifecycleManager::activate_with_priority(const std::string &skill_name,
                                                                  const std::uint64_t allocation,
                                                                  const int priority) {
  if (!allocator_) {
    return SkillResult<std::string>::failure(make_error(
        SkillErrorCode::InvalidRequest, "no budget allocator attached for priority activation"));
  }
  return activate_impl(skill_name, allocation, priority);
}

SkillResult<std::string> LifecycleManager::activate_impl(const std::string &skill_name,
                                                         const std::optional<std::uint64_t> allocation,
                                                         const std::optional<int> priority) {
  const auto loaded = load(skill_name);
  if (!loaded.ok()) {
    return SkillResult<std::string>::failure(loaded.error());
  }

  auto result = SkillResult<std::string>::failure(SkillError{});
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = activate_locked(skill_name, allocation, priority);
  }
  publish_metrics();
  return result;
}

SkillStatus LifecycleManager::deactivate(const std::string &skill_name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_locked(skill_name) != SkillState::Active) {
      return SkillStatus::success();
    }
    deactivate_locked(skill_name, "requested");
  }
  publish_metrics();
  return SkillStatus::success();
}

SkillStatus LifecycleManager::upgrade(const std::string &skill_name,
                                      const std::string &target_version) {
  if (!is_valid_skill_name(skill_name)) {
    return SkillStatus::failure(
        make_error(SkillErrorCode::InvalidRequest, "invalid skill name: '" + skill_name + "'"));
  }
  const auto target = Version::parse(target_version);
  if (!target.ok()) {
    return SkillStatus::failure(make_error(SkillErrorCode::InvalidVersion, target.error()));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = skills_.find(skill_name);
    if (it != skills_.end() && it->second.version.has_value() &&
        !it->second.version->compatible(target.value())) {
      return SkillStatus::failure(make_error(
          SkillErrorCode::IncompatibleVersion,
          "incompatible version upgrade: " + it->second.version->to_string() + " -> " +
              target.value().to_string() + "; major version must match"));
    }
  }

  auto fetched = fetch_from_source(skill_name, target.value().to_string(), LoadOptions{});

  std::vector<HookCall> hooks;
  SkillStatus status = SkillStatus::success();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = commit_upgrade_locked(skill_name, target.value(), std::move(fetched), hooks);
  }
  dispatch_hooks(hooks);
  publish_metrics();
  return status;
}

SkillStatus LifecycleManager::rollback(const std::string &skill_name, const std::size_t steps) {
  if (steps == 0) {
    return SkillStatus::failure(
        make_error(SkillErrorCode::InvalidRequest, "rollback steps must be at least 1"));
  }

  const auto upgrade_event = events_.nth_latest(skill_name, LifecycleEventType::Upgrade, steps);
  if (!upgrade_event.has_value()) {
    return SkillStatus::failure(make_error(
        SkillErrorCode::NoRollbackTarget,
        "cannot rollback " + std::to_string(steps) + " versions; only " +
            std::to_string(events_.count(skill_name, LifecycleEventType::Upgrade)) +
            " upgrades recorded"));
  }

  const auto from = upgrade_event->metadata.find("from_version");
  if (from == upgrade_event->metadata.end() || from->second.empty()) {
    return SkillStatus::failure(
        make_error(SkillErrorCode::NoRollbackTarget,
                   "upgrade #" + std::to_string(upgrade_event->sequence) +
                       " of " + skill_name + " has no previous version"));
  }
  return upgrade(skill_name, from->second);
}

SkillState LifecycleManager::get_state(const std::string &skill_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_locked(skill_name);
}

std::optional<Version> LifecycleManager::get_version(const std::string &skill_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = skills_.find(skill_name);
  if (it == skills_.end()) {
    return std::nullopt;
  }
  return it->second.version;
}

std::map<std::string, std::uint64_t> LifecycleManager::get_context_usage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::uint64_t> usage;
  for (const auto &[name, slot] : skills_) {
    if (slot.state == SkillState::Active) {
      usage[name] = allocation_locked(name, slot);
    }
  }
  return usage;
}

std::uint64_t LifecycleManager::get_available_budget() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t used = active_usage_locked();
  return used >= options_.context_budget ? 0 : options_.context_budget - used;
}

std::vector<LifecycleEvent>
LifecycleManager::get_events(const std::optional<std::string> &skill_name) const {
  if (skill_name.has_value()) {
    return events_.for_skill(*skill_name);
  }
  return events_.all();
}

std::vector<SkillSnapshot> LifecycleManager::list_skills() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SkillSnapshot> out;
  out.reserve(registration_order_.size());
  for (const auto &name : registration_order_) {
    const auto &slot = skills_.at(name);
    out.push_back(SkillSnapshot{.name = name,
                                .state = slot.state,
                                .version = slot.version,
                                .allocation = allocation_locked(name, slot),
                                .priority = slot.delegated_priority});
  }
  return out;
}

std::size_t LifecycleManager::loaded_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_locked(false);
}

std::size_t LifecycleManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_locked(true);
}

} // namespace skillgov::skills
