#include <gtest/gtest.h>
#include "Config.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {

std::string write_ini(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << body;
    return path.string();
}

const char* kShippedDefaults =
    "[assign]\n"
    "input =                 # JSON matrix file\n"
    "output = solution.json\n"
    "criterion = cost        # cost | time\n"
    "method = exact\n"
    "[other]\n"
    "method = greedy\n";

}  // namespace

TEST(IniValue, ReadsSectionKeysAndStripsComments) {
    std::string path = write_ini("task_assign_defaults.ini", kShippedDefaults);
    EXPECT_EQ(get_ini_value("assign", "criterion", path), "cost");
    EXPECT_EQ(get_ini_value("assign", "method", path), "exact");
    EXPECT_EQ(get_ini_value("assign", "input", path), "");
    EXPECT_EQ(get_ini_value("other", "method", path), "greedy");
    EXPECT_EQ(get_ini_value("assign", "vis", path), "");
    std::remove(path.c_str());
}

TEST(IniValue, MissingFileGivesEmpty) {
    EXPECT_EQ(get_ini_value("assign", "method", "/nonexistent/task_assign.ini"), "");
}

TEST(ConfigPath, SeparateAndEqualsForms) {
    const char* separate[] = {"task_assign", "--method", "greedy", "--config", "mine.ini"};
    EXPECT_EQ(find_config_path(5, separate), "mine.ini");

    const char* equals[] = {"task_assign", "--config=other.ini", "--method", "exact"};
    EXPECT_EQ(find_config_path(4, equals), "other.ini");

    const char* none[] = {"task_assign", "--input", "m.json"};
    EXPECT_EQ(find_config_path(3, none), "defaults.ini");

    // dangling flag with no value
    const char* dangling[] = {"task_assign", "--config"};
    EXPECT_EQ(find_config_path(2, dangling), "defaults.ini");
}

TEST(ResolveSetting, FileModeOrder) {
    EXPECT_EQ(resolve_setting("time", "cost", "cost", true), "time");
    EXPECT_EQ(resolve_setting("", "time", "cost", true), "time");
    EXPECT_EQ(resolve_setting("", "", "time", true), "time");
    EXPECT_EQ(resolve_setting("", "", "", true), "");
}

TEST(ResolveSetting, InteractiveRunIgnoresIni) {
    // the shipped ini sets criterion/method, the user must still be asked
    std::string path = write_ini("task_assign_interactive.ini", kShippedDefaults);
    std::string ini_crit = get_ini_value("assign", "criterion", path);
    ASSERT_EQ(ini_crit, "cost");
    EXPECT_EQ(resolve_setting("", "", ini_crit, false), "");
    EXPECT_EQ(resolve_setting("greedy", "", "exact", false), "greedy");
    std::remove(path.c_str());
}
