#include "test_framework.hpp"

#include "skillgov/net/curl_http_client.hpp"
#include "skillgov/skills/http_source.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>

namespace {

// Nothing listens on port 1, so every request fails fast without leaving the host.
constexpr const char *kClosedPort = "http://127.0.0.1:1";

void register_curl_tests(std::vector<skillgov::tests::TestCase> &tests) {
  using skillgov::tests::require;
  namespace sk = skillgov::skills;

  tests.push_back({"curl_refused_connection_is_network_error", [] {
                     skillgov::net::CurlHttpClient client;
                     const auto response =
                         client.get(std::string(kClosedPort) + "/index.txt", {}, 2'000, {});
                     require(response.network_error, "refused connection should fail");
                     require(!response.network_error_message.empty(), "curl error text kept");
                     require(response.status == 0, "no status without a response");
                   }});

  tests.push_back({"curl_stopped_request_does_not_succeed", [] {
                     skillgov::net::CurlHttpClient client;
                     std::stop_source stop;
                     stop.request_stop();
                     const auto response = client.get(std::string(kClosedPort) + "/x/SKILL.md",
                                                      {}, 2'000, stop.get_token());
                     require(response.network_error, "stopped request reports an error");
                   }});

  tests.push_back({"curl_backed_http_source_maps_failures", [] {
                     auto client = std::make_shared<skillgov::net::CurlHttpClient>();
                     sk::HttpSkillSource source(kClosedPort, client, 2'000);

                     const auto fetched = source.fetch(sk::FetchRequest{.name = "review"});
                     require(!fetched.ok(), "fetch should fail");
                     require(fetched.error().code == sk::SkillErrorCode::UnexpectedFault,
                             "transport failure is unexpected");
                     require(!source.list().ok(), "listing should fail");
                   }});
}

} // namespace

int main() {
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<skillgov::tests::TestCase> tests;
  register_curl_tests(tests);

  std::size_t failed = 0;
  for (const auto &test : tests) {
    try {
      test.fn();
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << tests.size() - failed << " passed, "
            << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
