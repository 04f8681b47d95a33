#include "skillgov/runtime/skill_runtime.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/config/config.hpp"
#include "skillgov/observability/factory.hpp"
#include "skillgov/observability/global.hpp"
#include "skillgov/skills/directory_source.hpp"
#include "skillgov/skills/http_source.hpp"
#include "skillgov/skills/memory_source.hpp"

namespace skillgov::runtime {

namespace {

using SourceResult = common::Result<std::shared_ptr<skills::ISkillSource>>;
using RuntimeResult = common::Result<std::shared_ptr<SkillRuntime>>;

} // namespace

SourceResult create_skill_source(const config::Config &config,
                                 std::shared_ptr<net::HttpClient> http_client) {
  const std::string kind = common::to_lower(common::trim(config.source.kind));

  if (kind.empty() || kind == "directory") {
    const std::string root = common::expand_path(config.source.skills_dir);
    if (root.empty()) {
      return SourceResult::failure("source.skills_dir is empty");
    }
    return SourceResult::success(std::make_shared<skills::DirectorySkillSource>(root));
  }

  if (kind == "memory") {
    return SourceResult::success(std::make_shared<skills::MemorySkillSource>());
  }

  if (kind == "http") {
    if (common::trim(config.source.base_url).empty()) {
      return SourceResult::failure("source.base_url is required for the http source");
    }
    if (!http_client) {
      return SourceResult::failure("http source requires an HTTP client");
    }
    return SourceResult::success(std::make_shared<skills::HttpSkillSource>(
        config.source.base_url, std::move(http_client), config.source.timeout_ms));
  }

  return SourceResult::failure("unknown source.kind: " + config.source.kind);
}

SkillRuntime::SkillRuntime(PrivateTag, config::Config config, std::vector<std::string> warnings,
                           std::shared_ptr<skills::ISkillSource> source)
    : config_(std::move(config)), warnings_(std::move(warnings)), source_(std::move(source)),
      allocator_(std::make_shared<budget::BudgetAllocator>(
          budget::BudgetOptions::from_config(config_.budget))),
      lifecycle_(std::make_unique<skills::LifecycleManager>(
          source_, skills::LifecycleOptions::from_config(config_.lifecycle), allocator_)) {}

RuntimeResult SkillRuntime::create(config::Config config,
                                   std::shared_ptr<net::HttpClient> http_client) {
  auto source = create_skill_source(config, std::move(http_client));
  if (!source.ok()) {
    return RuntimeResult::failure(source.error());
  }
  return create_with_source(std::move(config), std::move(source.value()));
}

RuntimeResult SkillRuntime::create_with_source(config::Config config,
                                               std::shared_ptr<skills::ISkillSource> source) {
  if (!source) {
    return RuntimeResult::failure("skill source is null");
  }
  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return RuntimeResult::failure(validated.error());
  }

  observability::set_global_observer(observability::create_observer(config));
  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }

  return RuntimeResult::success(std::make_shared<SkillRuntime>(
      PrivateTag{}, std::move(config), validated.value(), std::move(source)));
}

RuntimeResult SkillRuntime::from_disk(std::shared_ptr<net::HttpClient> http_client) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return RuntimeResult::failure(loaded.error());
  }
  return create(std::move(loaded.value()), std::move(http_client));
}

} // namespace skillgov::runtime
