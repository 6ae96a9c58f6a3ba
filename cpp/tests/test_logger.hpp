#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace reminorcpp::tests {

// Scenario progress goes to a dedicated "reminorcpp-test" logger. REMINORCPP_TEST_LOG=0 silences
// progress lines; failures are always printed.
inline bool ProgressEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    bool value = false;
#else
    bool value = true;
#endif
    if (const char* env = std::getenv("REMINORCPP_TEST_LOG"); env != nullptr) {
      std::string text(env);
      std::transform(text.begin(), text.end(), text.begin(),
                     [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
      value = text == "1" || text == "true" || text == "yes" || text == "on";
    }
    return value;
  }();
  return enabled;
}

inline spdlog::logger& TestLogger() {
  static const std::shared_ptr<spdlog::logger> logger = []() {
    auto created = spdlog::stderr_color_mt("reminorcpp-test");
    created->set_pattern("[%n] %^%l%$: %v");
    created->set_level(ProgressEnabled() ? spdlog::level::info : spdlog::level::err);
    return created;
  }();
  return *logger;
}

inline void Log(std::string_view message) {
  TestLogger().info("{}", message);
}

inline void LogError(std::string_view message) {
  TestLogger().error("{}", message);
}

template <typename Value>
inline void LogKV(std::string_view key, const Value& value) {
  TestLogger().info("{}={}", key, value);
}

}  // namespace reminorcpp::tests
