#pragma once

#include "skillgov/budget/allocator.hpp"
#include "skillgov/common/result.hpp"
#include "skillgov/config/schema.hpp"
#include "skillgov/net/http_client.hpp"
#include "skillgov/skills/lifecycle.hpp"
#include "skillgov/skills/source.hpp"

#include <memory>
#include <string>
#include <vector>

namespace skillgov::runtime {

// The http kind needs a client, e.g. net::CurlHttpClient from skillgov_curl.
[[nodiscard]] common::Result<std::shared_ptr<skills::ISkillSource>>
create_skill_source(const config::Config &config,
                    std::shared_ptr<net::HttpClient> http_client = nullptr);

class SkillRuntime {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  SkillRuntime(PrivateTag, config::Config config, std::vector<std::string> warnings,
               std::shared_ptr<skills::ISkillSource> source);

  [[nodiscard]] static common::Result<std::shared_ptr<SkillRuntime>>
  create(config::Config config, std::shared_ptr<net::HttpClient> http_client = nullptr);

  [[nodiscard]] static common::Result<std::shared_ptr<SkillRuntime>>
  create_with_source(config::Config config, std::shared_ptr<skills::ISkillSource> source);

  [[nodiscard]] static common::Result<std::shared_ptr<SkillRuntime>>
  from_disk(std::shared_ptr<net::HttpClient> http_client = nullptr);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }
  [[nodiscard]] std::shared_ptr<skills::ISkillSource> source() const { return source_; }
  [[nodiscard]] std::shared_ptr<budget::BudgetAllocator> allocator() const { return allocator_; }
  [[nodiscard]] skills::LifecycleManager &lifecycle() { return *lifecycle_; }
  [[nodiscard]] const skills::LifecycleManager &lifecycle() const { return *lifecycle_; }

private:
  config::Config config_;
  std::vector<std::string> warnings_;
  std::shared_ptr<skills::ISkillSource> source_;
  std::shared_ptr<budget::BudgetAllocator> allocator_;
  std::unique_ptr<skills::LifecycleManager> lifecycle_;
};

} // namespace skillgov::runtime
