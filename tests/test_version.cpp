#include "test_framework.hpp"

#include "skillgov/skills/error.hpp"
#include "skillgov/skills/state.hpp"
#include "skillgov/skills/version.hpp"

void register_version_tests(std::vector<skillgov::tests::TestCase> &tests) {
  using skillgov::tests::require;
  namespace sk = skillgov::skills;

  tests.push_back({"version_parse_full_triplet", [] {
                     const auto parsed = sk::Version::parse("1.2.3");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().major == 1 && parsed.value().minor == 2 &&
                                 parsed.value().patch == 3,
                             "components should round into major.minor.patch");
                     require(parsed.value().to_string() == "1.2.3", "to_string mismatch");
                   }});

  tests.push_back({"version_parse_fills_missing_components", [] {
                     const auto major_only = sk::Version::parse("v2");
                     require(major_only.ok(), major_only.error());
                     require(major_only.value().to_string() == "2.0.0", "v2 should be 2.0.0");

                     const auto two_parts = sk::Version::parse(" 1.4 ");
                     require(two_parts.ok(), two_parts.error());
                     require(two_parts.value().to_string() == "1.4.0", "1.4 should be 1.4.0");
                   }});

  tests.push_back({"version_parse_rejects_garbage", [] {
                     require(!sk::Version::parse("").ok(), "empty should fail");
                     require(!sk::Version::parse("1.x.0").ok(), "non numeric should fail");
                     require(!sk::Version::parse("1.2.3.4").ok(), "four parts should fail");
                     require(!sk::Version::parse("1..2").ok(), "empty component should fail");
                     require(!sk::Version::parse("-1.0.0").ok(), "negative should fail");
                   }});

  tests.push_back({"version_compatibility_is_same_major", [] {
                     const sk::Version v100{.major = 1, .minor = 0, .patch = 0};
                     const sk::Version v190{.major = 1, .minor = 9, .patch = 0};
                     const sk::Version v200{.major = 2, .minor = 0, .patch = 0};
                     require(v100.compatible(v190), "1.0.0 and 1.9.0 should be compatible");
                     require(!v100.compatible(v200), "1.0.0 and 2.0.0 should be incompatible");
                     require(v100 < v190 && v190 < v200, "ordering should be numeric");
                   }});

  tests.push_back({"version_ordering_is_numeric_not_lexical", [] {
                     const auto v9 = sk::Version::parse("1.9.0").value();
                     const auto v10 = sk::Version::parse("1.10.0").value();
                     require(v9 < v10, "1.9.0 should sort before 1.10.0");
                   }});

  tests.push_back({"version_marker_found_in_content", [] {
                     const auto marker =
                         sk::find_version_marker("# Skill\nversion: 1.2.0\nDo things.");
                     require(marker.has_value() && *marker == "1.2.0", "marker should be found");

                     const auto quoted = sk::find_version_marker("version = \"3.0.1\"");
                     require(quoted.has_value() && *quoted == "3.0.1", "quoted marker");
                   }});

  tests.push_back({"version_from_content_defaults_to_1_0_0", [] {
                     require(sk::version_from_content("no marker here").to_string() == "1.0.0",
                             "missing marker should default");
                     require(sk::version_from_content("version: 1.1.0").to_string() == "1.1.0",
                             "marker should be used");
                   }});

  tests.push_back({"skill_state_strings_round_trip", [] {
                     for (const auto state :
                          {sk::SkillState::Discovered, sk::SkillState::Loaded,
                           sk::SkillState::Active, sk::SkillState::Unloaded,
                           sk::SkillState::Error}) {
                       const auto parsed =
                           sk::skill_state_from_string(sk::skill_state_to_string(state));
                       require(parsed.has_value() && *parsed == state, "state round trip");
                     }
                     require(!sk::skill_state_from_string("bogus").has_value(),
                             "unknown state should not parse");
                     require(sk::is_resident(sk::SkillState::Active), "active is resident");
                     require(!sk::is_resident(sk::SkillState::Error), "error is not resident");
                   }});

  tests.push_back({"skill_error_to_string_includes_code", [] {
                     const auto error = sk::make_error(sk::SkillErrorCode::NotFound, "missing");
                     require(error.to_string().find("not_found") != std::string::npos,
                             "code should be rendered: " + error.to_string());
                     require(error.to_string().find("missing") != std::string::npos,
                             "message should be rendered");
                   }});
}
