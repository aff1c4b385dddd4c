// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "sigbt/backtest/backtest_runner.hpp"
#include "sigbt/core/config_base.hpp"

using namespace sigbt;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "sigbt_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;

    nlohmann::json partial;
    partial["name"] = "partial";
    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongFieldTypeIsParseError) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "wrong_type.json";
    std::ofstream file(file_path);
    file << R"({"value": "not a number"})";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, MissingFileIsNotFound) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "does_not_exist.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, RunConfigSerialization) {
    backtest::BacktestRunConfig config;
    config.data_path = "bars.csv";
    config.output_prefix = "sma";
    config.clean_input = true;
    config.simulation.position_size = 0.5;
    config.simulation.stop_loss_pct = 0.05;
    config.analysis.trading_periods_per_year = 365;
    config.logger.min_level = LogLevel::DEBUG;

    std::filesystem::path file_path = test_dir / "run.json";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    backtest::BacktestRunConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(file_path.string()).is_ok());

    EXPECT_EQ(loaded.data_path, "bars.csv");
    EXPECT_EQ(loaded.output_prefix, "sma");
    EXPECT_TRUE(loaded.clean_input);
    EXPECT_DOUBLE_EQ(loaded.simulation.position_size, 0.5);
    ASSERT_TRUE(loaded.simulation.stop_loss_pct.has_value());
    EXPECT_DOUBLE_EQ(*loaded.simulation.stop_loss_pct, 0.05);
    EXPECT_FALSE(loaded.simulation.take_profit_pct.has_value());
    EXPECT_EQ(loaded.analysis.trading_periods_per_year, 365);
    EXPECT_EQ(loaded.logger.min_level, LogLevel::DEBUG);
    EXPECT_TRUE(loaded.validate().is_ok());
}

TEST_F(ConfigBaseTest, RunConfigRequiresDataPath) {
    backtest::BacktestRunConfig config;
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigBaseTest, LoadFromJsonReportsTypeErrors) {
    TestConfig config;
    auto result = config.load_from_json(nlohmann::json{{"ratio", "half"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    EXPECT_TRUE(config.load_from_json(nlohmann::json{{"ratio", 0.25}}).is_ok());
    EXPECT_DOUBLE_EQ(config.ratio, 0.25);
}
