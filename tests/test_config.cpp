#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config/config.hpp"
#include "utils/uuid.hpp"

using namespace pmsim;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_config_" + generate_uuid() + ".json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write_file(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;

    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.simulation.total_points, 1500);
    EXPECT_DOUBLE_EQ(config.simulation.threshold_fraction, 0.7);
    EXPECT_DOUBLE_EQ(config.portfolio.default_starting_cash, 15000.0);
    EXPECT_EQ(config.portfolio.strikes.size(), 6u);
    EXPECT_EQ(config.portfolio.min_liquidity, 10);
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    Config config;
    config.simulation.total_points = 250;
    config.simulation.seed = 1234;
    config.portfolio.strikes = {0.25, 0.75};
    config.portfolio.decay_horizon_points = 250;
    config.export_.enabled = false;
    config.persistence.db_path = "/tmp/elsewhere.db";
    config.save(path_);

    Config loaded = Config::load(path_);

    EXPECT_EQ(loaded.simulation.total_points, 250);
    EXPECT_EQ(loaded.simulation.seed, 1234u);
    ASSERT_EQ(loaded.portfolio.strikes.size(), 2u);
    EXPECT_DOUBLE_EQ(loaded.portfolio.strikes[1], 0.75);
    EXPECT_EQ(loaded.portfolio.decay_horizon_points, 250);
    EXPECT_FALSE(loaded.export_.enabled);
    EXPECT_EQ(loaded.persistence.db_path, "/tmp/elsewhere.db");
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    write_file(R"({"simulation": {"total_points": 40}, "export": {"directory": "/tmp/out"}})");

    Config loaded = Config::load(path_);

    EXPECT_EQ(loaded.simulation.total_points, 40);
    EXPECT_DOUBLE_EQ(loaded.simulation.volatility, 1.8);
    EXPECT_EQ(loaded.export_.directory, "/tmp/out");
    EXPECT_TRUE(loaded.export_.enabled);
    EXPECT_DOUBLE_EQ(loaded.portfolio.max_position_fraction, 0.2);
}

TEST_F(ConfigTest, LoadRejectsInvalidValues) {
    write_file(R"({"simulation": {"threshold_fraction": 1.5}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, LoadRejectsMalformedJson) {
    write_file("{ not json");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, LoadRejectsMissingFile) {
    EXPECT_THROW(Config::load("/tmp/does_not_exist_" + generate_uuid() + ".json"), std::runtime_error);
}

TEST_F(ConfigTest, ValidationMessagesNameTheField) {
    SimulationConfig sim;
    sim.total_points = 0;
    EXPECT_NE(sim.validation_error().find("total_points"), std::string::npos);

    PortfolioConfig portfolio;
    portfolio.strikes = {0.5, 1.0};
    EXPECT_NE(portfolio.validation_error().find("strikes"), std::string::npos);

    portfolio.strikes = {};
    EXPECT_FALSE(portfolio.validation_error().empty());
}

TEST_F(ConfigTest, EnvironmentFallsBackToDefault) {
    EXPECT_EQ(Config::get_env("PMSIM_TEST_UNSET_VARIABLE", "fallback"), "fallback");
}
