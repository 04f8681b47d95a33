#include "test_framework.hpp"

#include "skillgov/common/fs.hpp"
#include "skillgov/common/toml.hpp"
#include "skillgov/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = skillgov::config::config_path_override();
    if (next.has_value()) {
      skillgov::config::set_config_path_override(*next);
    } else {
      skillgov::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      skillgov::config::set_config_path_override(*old_override);
    } else {
      skillgov::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("skillgov-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<skillgov::tests::TestCase> &tests) {
  using skillgov::tests::require;
  namespace cfg = skillgov::config;

  tests.push_back({"toml_sections_comments_and_separators", [] {
                     const auto parsed = skillgov::common::parse_toml(R"(
top = "value" # trailing comment
[lifecycle]
context_budget = 12_000
name = "has # inside"
ratio = 0.25
bad_number = 12abc
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("top", "") == "value", "top-level key");
                     require(doc.get_u64("lifecycle.context_budget", 0) == 12'000,
                             "digit separators should be accepted");
                     require(doc.get_string("lifecycle.name", "") == "has # inside",
                             "hash inside quotes is not a comment");
                     require(doc.get_double("lifecycle.ratio", 0.0) == 0.25, "double value");
                     require(doc.get_u64("lifecycle.bad_number", 7) == 7,
                             "malformed number falls back");
                     require(!doc.has("missing"), "missing key");
                   }});

  tests.push_back({"toml_rejects_malformed_lines", [] {
                     require(!skillgov::common::parse_toml("[]\n").ok(), "empty section");
                     require(!skillgov::common::parse_toml("just words\n").ok(), "no equals");
                     require(!skillgov::common::parse_toml(" = 3\n").ok(), "missing key");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard clear_path("SKILLGOV_CONFIG_PATH", std::nullopt);
                     const EnvGuard clear_budget("SKILLGOV_CONTEXT_BUDGET", std::nullopt);

                     require(!cfg::config_exists(), "no config file yet");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.lifecycle.max_loaded_skills == 20, "max loaded default");
                     require(config.lifecycle.max_active_skills == 5, "max active default");
                     require(config.lifecycle.context_budget == 10'000, "budget default");
                     require(config.lifecycle.default_allocation == 2'000, "allocation default");
                     require(config.budget.total_budget == 10'000, "pool default");
                     require(config.source.skills_dir ==
                                 (home / ".skillgov" / "skills").string(),
                             "skills dir should expand ~: " + config.source.skills_dir);
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".skillgov" / "config.toml",
                             "default config location");

                     write_file(path.value(), R"(
[lifecycle]
max_loaded_skills = 8
max_active_skills = 3
context_budget = 16_000
default_allocation = 1500
fetch_timeout_ms = 250
over_budget = "Allow"

[budget]
shrink_below = 0.2
shrink_percent = 50
expand_above = 0.8

[source]
kind = "http"
base_url = "https://skills.example/registry"

[observability]
backend = "log"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.lifecycle.max_loaded_skills == 8, "max loaded");
                     require(config.lifecycle.max_active_skills == 3, "max active");
                     require(config.lifecycle.context_budget == 16'000, "context budget");
                     require(config.lifecycle.fetch_timeout_ms == 250, "fetch timeout");
                     require(config.lifecycle.over_budget == "allow", "policy lowercased");
                     require(config.budget.total_budget == 16'000,
                             "pool follows context budget when unset");
                     require(config.budget.shrink_percent == 50, "shrink percent");
                     require(config.source.kind == "http", "source kind");
                     require(config.source.base_url == "https://skills.example/registry", "url");
                     require(cfg::config_exists(), "file should now exist");
                   }});

  tests.push_back({"config_path_override_points_at_file", [] {
                     const auto home = make_temp_home();
                     const auto custom = home / "custom" / "skillgov.toml";
                     write_file(custom, "[lifecycle]\nmax_active_skills = 2\n");
                     const ConfigOverrideGuard cfg_override(custom);

                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == custom, "override path used");
                     const auto dir = cfg::config_dir();
                     require(dir.ok() && dir.value() == custom.parent_path(), "override dir");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().lifecycle.max_active_skills == 2, "value from override");
                   }});

  tests.push_back({"load_config_reports_parse_errors", [] {
                     const auto home = make_temp_home();
                     const auto custom = home / "broken.toml";
                     write_file(custom, "[lifecycle]\nthis is not toml\n");
                     const ConfigOverrideGuard cfg_override(custom);
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken file should fail");
                     require(loaded.error().find("line 2") != std::string::npos,
                             "line number should be reported: " + loaded.error());
                   }});

  tests.push_back({"env_override_precedence", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     write_file(home / ".skillgov" / "config.toml",
                                "[lifecycle]\nmax_loaded_skills = 8\ncontext_budget = 4000\n");
                     const EnvGuard env_loaded("SKILLGOV_MAX_LOADED_SKILLS",
                                               std::optional<std::string>("12"));
                     const EnvGuard env_budget("SKILLGOV_CONTEXT_BUDGET",
                                               std::optional<std::string>("not-a-number"));
                     const EnvGuard env_dir("SKILLGOV_SKILLS_DIR",
                                            std::optional<std::string>("~/elsewhere"));
                     const EnvGuard env_obs("SKILLGOV_OBSERVABILITY",
                                            std::optional<std::string>("none"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.lifecycle.max_loaded_skills == 12, "env should win");
                     require(config.lifecycle.context_budget == 4'000,
                             "unparsable env value should be ignored");
                     require(config.source.skills_dir == (home / "elsewhere").string(),
                             "env skills dir should expand ~");
                     require(config.observability.backend == "none", "observability override");
                   }});

  tests.push_back({"validate_config_defaults_are_clean", [] {
                     const auto result = cfg::validate_config(cfg::Config{});
                     require(result.ok(), result.error());
                     require(result.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"validate_config_rejects_bad_limits", [] {
                     cfg::Config config;
                     config.lifecycle.max_active_skills = 30;
                     require(!cfg::validate_config(config).ok(),
                             "active above loaded should fail");

                     config = cfg::Config{};
                     config.lifecycle.default_allocation = 20'000;
                     require(!cfg::validate_config(config).ok(),
                             "default allocation above budget should fail");

                     config = cfg::Config{};
                     config.lifecycle.over_budget = "maybe";
                     require(!cfg::validate_config(config).ok(), "unknown policy should fail");

                     config = cfg::Config{};
                     config.budget.shrink_below = 0.95;
                     require(!cfg::validate_config(config).ok(),
                             "shrink threshold above expand threshold should fail");

                     config = cfg::Config{};
                     config.budget.shrink_percent = 0;
                     require(!cfg::validate_config(config).ok(), "shrink percent 0 should fail");

                     config = cfg::Config{};
                     config.source.kind = "ftp";
                     require(!cfg::validate_config(config).ok(), "unknown source should fail");
                   }});

  tests.push_back({"validate_config_http_source_rules", [] {
                     cfg::Config config;
                     config.source.kind = "http";
                     require(!cfg::validate_config(config).ok(), "http needs a base url");

                     config.source.base_url = "ftp://skills.example";
                     require(!cfg::validate_config(config).ok(), "scheme must be http(s)");

                     config.source.base_url = "http://skills.example";
                     const auto plain = cfg::validate_config(config);
                     require(plain.ok() && plain.value().size() == 1, "plain http warns");

                     config.source.base_url = "https://skills.example";
                     const auto secure = cfg::validate_config(config);
                     require(secure.ok() && secure.value().empty(), "https is clean");
                   }});

  tests.push_back({"validate_config_warns_on_split_pools", [] {
                     cfg::Config config;
                     config.budget.total_budget = 5'000;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "differing pools should warn");
                   }});
}
