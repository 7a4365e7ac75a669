/**
 * @file test_host_files.cpp
 * @brief Unit tests for /proc and /sys helpers.
 */

#include "device/host_files.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace archetype;

class HostFilesTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "archetype_test_host_files";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(HostFilesTest, ParseMeminfo) {
    auto path = write("meminfo",
        "MemTotal:       16384000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    8192000 kB\n");
    auto mem = host::parse_meminfo(path);
    ASSERT_TRUE(mem.has_value());
    EXPECT_EQ(mem->total_kb, 16384000u);
    EXPECT_EQ(mem->available_kb, 8192000u);
}

TEST_F(HostFilesTest, MeminfoWithoutAvailableUsesFree) {
    auto path = write("meminfo", "MemTotal: 2048 kB\nMemFree: 512 kB\n");
    auto mem = host::parse_meminfo(path);
    ASSERT_TRUE(mem.has_value());
    EXPECT_EQ(mem->available_kb, 512u);
}

TEST_F(HostFilesTest, MissingFile) {
    EXPECT_FALSE(host::parse_meminfo(dir_ / "absent").has_value());
    EXPECT_TRUE(host::read_file_line(dir_ / "absent").empty());
    EXPECT_FALSE(host::read_file(dir_ / "absent").has_value());
}

TEST_F(HostFilesTest, ParseCpuinfo) {
    auto path = write("cpuinfo",
        "processor\t: 0\n"
        "model name\t: Intel(R) Core(TM) i7-9700K\n"
        "flags\t\t: fpu sse f16c avx2\n"
        "\n"
        "processor\t: 1\n"
        "model name\t: Intel(R) Core(TM) i7-9700K\n"
        "flags\t\t: fpu sse f16c avx2\n");
    auto cpu = host::parse_cpuinfo(path);
    ASSERT_TRUE(cpu.has_value());
    EXPECT_EQ(cpu->logical_cores, 2u);
    EXPECT_EQ(cpu->model_name, "Intel(R) Core(TM) i7-9700K");
    EXPECT_TRUE(cpu->has_flag("f16c"));
    EXPECT_FALSE(cpu->has_flag("avx512_vnni"));
}

TEST_F(HostFilesTest, CpuTimesAndBusyPercent) {
    auto path = write("stat", "cpu  100 0 100 800 0 0 0 0 0 0\ncpu0 50 0 50 400 0 0 0 0\n");
    auto before = host::read_cpu_times(path);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->idle, 800u);

    host::CpuTimes after = *before;
    after.user += 30;
    after.idle += 70;
    EXPECT_FLOAT_EQ(host::cpu_busy_percent(*before, after), 30.0f);
    EXPECT_FLOAT_EQ(host::cpu_busy_percent(after, after), 0.0f);
}

TEST(HostParseTest, Integers) {
    EXPECT_EQ(host::parse_uint(" 42\n"), 42u);
    EXPECT_EQ(host::parse_uint("0x10de"), 0x10deu);
    EXPECT_FALSE(host::parse_uint("12abc").has_value());
    EXPECT_FALSE(host::parse_uint("").has_value());
}

TEST(HostParseTest, Floats) {
    EXPECT_FLOAT_EQ(*host::parse_float("120.5"), 120.5f);
    EXPECT_FALSE(host::parse_float("[N/A]").has_value());
    EXPECT_FALSE(host::parse_float("n/a").has_value());
}

TEST(HostParseTest, Split) {
    auto parts = host::split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(HostParseTest, Vendors) {
    EXPECT_EQ(host::vendor_from_pci_id(0x10de), Vendor::Nvidia);
    EXPECT_EQ(host::vendor_from_pci_id(0x1002), Vendor::Amd);
    EXPECT_EQ(host::vendor_from_pci_id(0xffff), Vendor::Unknown);
    EXPECT_EQ(host::vendor_from_name("Advanced Micro Devices, Inc."), Vendor::Amd);
    EXPECT_EQ(host::vendor_from_name("Intel(R) Corporation"), Vendor::Intel);
}
