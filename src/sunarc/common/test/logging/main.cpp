#include "sunarc/common/logging.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

using namespace sunarc;

namespace {

class CaptureLog : public Log {
protected:
  void write(Level level, const char* message) const override {
    entries.emplace_back(level, message);
  }

public:
  mutable std::vector<std::pair<Level, std::string>> entries;
};

struct ScopedGlobalLog {
  explicit ScopedGlobalLog(Log* log) {
    Log::set_global_instance(log);
  }
  ~ScopedGlobalLog() {
    Log::set_global_instance(nullptr);
  }
};

} //  anon

TEST(Log, MetaDataPrefixesTheMessage) {
  CaptureLog log;
  log.warning("fetch failed", Log::MetaData("Weather", "tick", "/src/schedule/Scheduler.cpp", 42));
  ASSERT_EQ(log.entries.size(), 1u);
  EXPECT_EQ(log.entries[0].first, Log::Level::Warning);
  EXPECT_EQ(log.entries[0].second, "[Weather] (tick, Scheduler.cpp:42): fetch failed");
}

TEST(Log, TagOnlyMetaData) {
  CaptureLog log;
  log.info("hello", Log::MetaData("main"));
  ASSERT_EQ(log.entries.size(), 1u);
  EXPECT_EQ(log.entries[0].second, "[main] hello");
}

TEST(Log, MinimumLevelFiltersMessages) {
  CaptureLog log;
  log.set_min_level(Log::Level::Warning);
  log.info("dropped");
  log.warning("kept");
  log.error("kept too");
  ASSERT_EQ(log.entries.size(), 2u);
  EXPECT_EQ(log.entries[0].first, Log::Level::Warning);
  EXPECT_EQ(log.entries[1].first, Log::Level::Error);
  EXPECT_EQ(log.get_min_level(), Log::Level::Warning);
}

TEST(Log, CaptureMacrosUseTheGlobalInstance) {
  CaptureLog log;
  {
    ScopedGlobalLog scope{&log};
    EXPECT_EQ(Log::get_global_instance(), &log);
    SUNARC_LOG_WARNING_CAPTURE_META("from macro", "test");
    SUNARC_LOG_SEVERE_CAPTURE_META("always on", "test");
  }

#if SUNARC_LOGGING_ENABLED == 1
  ASSERT_EQ(log.entries.size(), 2u);
  EXPECT_NE(log.entries[0].second.find("from macro"), std::string::npos);
#else
  ASSERT_EQ(log.entries.size(), 1u);
#endif
  EXPECT_EQ(log.entries.back().first, Log::Level::Severe);
  EXPECT_EQ(log.entries.back().second.rfind("[test] (", 0), 0u);
}

TEST(Log, DefaultInstanceIsCreatedOnDemand) {
  Log::set_global_instance(nullptr);
  auto* instance = Log::require_global_instance();
  ASSERT_NE(instance, nullptr);
  EXPECT_EQ(Log::require_global_instance(), instance);
  Log::delete_default_global_instance();
  EXPECT_EQ(Log::get_global_instance(), nullptr);
}

TEST(Log, LevelStrings) {
  EXPECT_STREQ(Log::level_string(Log::Level::Info), "INFO");
  EXPECT_STREQ(Log::level_string(Log::Level::Severe), "SEVERE");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
