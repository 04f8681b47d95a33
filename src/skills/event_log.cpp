#include "skillgov/skills/event_log.hpp"

#include "skillgov/common/json_util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace skillgov::skills {

std::string_view lifecycle_event_type_to_string(const LifecycleEventType type) {
  switch (type) {
  case LifecycleEventType::Discover:
    return "discover";
  case LifecycleEventType::Load:
    return "load";
  case LifecycleEventType::LoadError:
    return "load_error";
  case LifecycleEventType::Unload:
    return "unload";
  case LifecycleEventType::Activate:
    return "activate";
  case LifecycleEventType::Deactivate:
    return "deactivate";
  case LifecycleEventType::Upgrade:
    return "upgrade";
  case LifecycleEventType::UpgradeError:
    return "upgrade_error";
  case LifecycleEventType::HookError:
  default:
    return "hook_error";
  }
}

std::uint64_t EventLog::append(std::string skill_name, const LifecycleEventType type,
                               const SkillState old_state, const SkillState new_state,
                               std::optional<std::string> version, EventMetadata metadata) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto timestamp = std::chrono::system_clock::now();
  // Wall clock may step backwards; keep timestamps non-decreasing in log order.
  if (!events_.empty() && timestamp < events_.back().timestamp) {
    timestamp = events_.back().timestamp;
  }

  LifecycleEvent event;
  event.sequence = next_sequence_++;
  event.skill_name = std::move(skill_name);
  event.type = type;
  event.timestamp = timestamp;
  event.old_state = old_state;
  event.new_state = new_state;
  event.version = std::move(version);
  event.metadata = std::move(metadata);
  events_.push_back(std::move(event));
  return events_.back().sequence;
}

std::vector<LifecycleEvent> EventLog::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<LifecycleEvent> EventLog::for_skill(const std::string &skill_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LifecycleEvent> out;
  for (const auto &event : events_) {
    if (event.skill_name == skill_name) {
      out.push_back(event);
    }
  }
  return out;
}

std::optional<LifecycleEvent> EventLog::nth_latest(const std::string &skill_name,
                                                   const LifecycleEventType type,
                                                   const std::size_t n) const {
  if (n == 0) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t seen = 0;
  for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
    if (it->skill_name == skill_name && it->type == type && ++seen == n) {
      return *it;
    }
  }
  return std::nullopt;
}

std::size_t EventLog::count(const std::string &skill_name, const LifecycleEventType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &event : events_) {
    if (event.skill_name == skill_name && event.type == type) {
      ++total;
    }
  }
  return total;
}

std::size_t EventLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

std::string format_timestamp(const std::chrono::system_clock::time_point timestamp) {
  const auto t = std::chrono::system_clock::to_time_t(timestamp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp.time_since_epoch()) %
                      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis.count() << 'Z';
  return out.str();
}

std::string events_to_json(const std::vector<LifecycleEvent> &events) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto &event = events[i];
    if (i > 0) {
      out << ',';
    }
    out << "{\"sequence\":" << event.sequence;
    out << ",\"skill_name\":" << common::json_quote(event.skill_name);
    out << ",\"event_type\":\"" << lifecycle_event_type_to_string(event.type) << '"';
    out << ",\"timestamp\":\"" << format_timestamp(event.timestamp) << '"';
    out << ",\"old_state\":\"" << skill_state_to_string(event.old_state) << '"';
    out << ",\"new_state\":\"" << skill_state_to_string(event.new_state) << '"';
    out << ",\"version\":";
    if (event.version.has_value()) {
      out << common::json_quote(*event.version);
    } else {
      out << "null";
    }
    out << ",\"metadata\":{";
    bool first = true;
    for (const auto &[key, value] : event.metadata) {
      if (!first) {
        out << ',';
      }
      first = false;
      out << common::json_quote(key) << ':' << common::json_quote(value);
    }
    out << "}}";
  }
  out << ']';
  return out.str();
}

} // namespace skillgov::skills
