/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace archetype;

TEST(PreferenceTest, ParseIsCaseAndDashInsensitive) {
    EXPECT_EQ(parse_preference("auto"), DevicePreference::Auto);
    EXPECT_EQ(parse_preference("GPU_ONLY"), DevicePreference::GpuOnly);
    EXPECT_EQ(parse_preference("nvidia-only"), DevicePreference::NvidiaOnly);
    EXPECT_FALSE(parse_preference("tpu_only").has_value());
}

TEST(PreferenceTest, RoundTripsThroughName) {
    for (auto pref : {DevicePreference::Auto, DevicePreference::CpuOnly,
                      DevicePreference::AmdOnly, DevicePreference::IntelOnly}) {
        EXPECT_EQ(parse_preference(to_string(pref)), pref);
    }
}

TEST(UnitTypeTest, Parse) {
    EXPECT_EQ(parse_unit_type("MLP"), UnitType::Mlp);
    EXPECT_EQ(parse_unit_type("cnn"), UnitType::Cnn);
    EXPECT_FALSE(parse_unit_type("transformer").has_value());
}

TEST(JobStateTest, TerminalStates) {
    EXPECT_TRUE(is_terminal(JobState::Completed));
    EXPECT_TRUE(is_terminal(JobState::Cancelled));
    EXPECT_TRUE(is_terminal(JobState::Failed));
    EXPECT_FALSE(is_terminal(JobState::Stopping));
    EXPECT_FALSE(is_terminal(JobState::Paused));
}

TEST(JobStateTest, ParseLowercaseNames) {
    EXPECT_EQ(parse_job_state("running"), JobState::Running);
    EXPECT_EQ(parse_job_state("Completed"), JobState::Completed);
    EXPECT_FALSE(parse_job_state("done").has_value());
}

TEST(BackendKindTest, DeclarationOrderIsProbeOrder) {
    EXPECT_LT(BackendKind::NativeAccel, BackendKind::VendorBridge);
    EXPECT_LT(BackendKind::UnifiedMemory, BackendKind::CpuFallback);
    EXPECT_EQ(to_string(BackendKind::OpenCompute), "OPEN_COMPUTE");
}

TEST(UuidTest, VersionFourFormat) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(TimestampTest, Iso8601Utc) {
    Timestamp ts{std::chrono::milliseconds(1700000000123)};
    EXPECT_EQ(format_iso8601(ts), "2023-11-14T22:13:20.123Z");
    EXPECT_DOUBLE_EQ(to_unix_seconds(ts), 1700000000.123);
}
