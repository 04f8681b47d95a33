#pragma once

#include "skillgov/net/http_client.hpp"
#include "skillgov/skills/source.hpp"

#include <memory>

namespace skillgov::skills {

class HttpSkillSource final : public ISkillSource {
public:
  HttpSkillSource(std::string base_url, std::shared_ptr<net::HttpClient> client,
                  std::uint64_t timeout_ms = 10'000, net::HttpHeaders headers = {});

  [[nodiscard]] SkillResult<FetchedSkill> fetch(const FetchRequest &request) override;
  [[nodiscard]] common::Result<std::vector<std::string>> list() override;
  [[nodiscard]] std::string_view name() const override { return "http"; }

private:
  [[nodiscard]] std::string url_for(const std::string &path) const;
  [[nodiscard]] SkillResult<FetchedSkill> fetch_url(const std::string &url,
                                                    const FetchRequest &request) const;

  std::string base_url_;
  std::shared_ptr<net::HttpClient> client_;
  std::uint64_t timeout_ms_;
  net::HttpHeaders headers_;
};

} // namespace skillgov::skills
