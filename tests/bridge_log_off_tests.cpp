// Built with RBRIDGE_LOG_MIN_LEVEL_I=3: trace/debug/info macros are compiled out.
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "bridge_log.hpp"

namespace {
using namespace redis_bridge;

struct CaptureLogger final : Logger {
    void log(Level lvl, std::string_view msg) noexcept override { entries.emplace_back(lvl, std::string(msg)); }
    bool should_log(Level) const noexcept override { return true; }
    std::vector<std::pair<Level, std::string>> entries;
};

} // namespace

TEST(LogCompiledOut, LowLevelsDoNotEvaluateArguments) {
    auto lg = std::make_shared<CaptureLogger>();
    int side = 0;
    auto bump = [&] { return ++side; };
    RBRIDGE_TRACE_RT(lg, "t {}", bump());
    RBRIDGE_DEBUG_RT(lg, "d {}", bump());
    RBRIDGE_INFO_RT(lg, "i {}", bump());
    EXPECT_EQ(side, 0);
    EXPECT_TRUE(lg->entries.empty());
}

TEST(LogCompiledOut, WarnAndAboveStillLog) {
    auto lg = std::make_shared<CaptureLogger>();
    int side = 0;
    auto bump = [&] { return ++side; };
    RBRIDGE_WARN_RT(lg, "w {}", bump());
    RBRIDGE_CRITICAL_RT(lg, "c {}", bump());
    EXPECT_EQ(side, 2);
    ASSERT_EQ(lg->entries.size(), 2u);
    EXPECT_NE(lg->entries[0].second.find("w 1"), std::string::npos);
}

TEST(LogCompiledOut, DynamicLevelMacroIsNotGated) {
    auto lg = std::make_shared<CaptureLogger>();
    RBRIDGE_LOGF_RT(lg, Logger::Level::debug, "dyn {}", 1);
    ASSERT_EQ(lg->entries.size(), 1u);
    EXPECT_EQ(lg->entries[0].second, "dyn 1");
}
