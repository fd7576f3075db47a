#include "gtest/gtest.h"
#include "config/SimulationConfig.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace netepi;

class SimulationConfigTest : public ::testing::Test {
protected:
    std::string baseTestDir = "temp_simulation_config_test_dir";

    void SetUp() override {
        fs::remove_all(baseTestDir);
        fs::create_directories(baseTestDir);
    }

    void TearDown() override {
        fs::remove_all(baseTestDir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::string path = (fs::path(baseTestDir) / name).string();
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(SimulationConfigTest, DefaultsWhenFileEmpty) {
    SimulationConfig config = loadSimulationConfig(writeFile("empty.txt", "# only a comment\n\n"));
    EXPECT_EQ(config.population_size, 1000u);
    EXPECT_EQ(config.network_m, 5u);
    EXPECT_NEAR(config.network_p, 1.0 / 3.0, 1e-12);
    EXPECT_EQ(config.min_connections, 5);
    EXPECT_EQ(config.ndays, 90);
    EXPECT_EQ(config.delay, 0);
}

TEST_F(SimulationConfigTest, ReadsAllKeys) {
    std::string path = writeFile("full.txt",
        "population_size 250\n"
        "network_m 3   # attachments\n"
        "network_p 0.2\n"
        "network_seed 9\n"
        "contagiousness 0.1\n"
        "incubation_zeta 1.0\n"
        "incubation_sigma 0.4\n"
        "sickness_zeta 1.5\n"
        "sickness_sigma 0.6\n"
        "max_gathering_size 8\n"
        "min_connections 4\n"
        "delay 12\n"
        "ndays 60\n"
        "initial_cases 2\n"
        "initial_incubation_days 1\n"
        "replicates 5\n"
        "rng_seed 77\n"
        "log_level debug\n");
    SimulationConfig config = loadSimulationConfig(path);

    EXPECT_EQ(config.population_size, 250u);
    EXPECT_EQ(config.network_m, 3u);
    EXPECT_DOUBLE_EQ(config.network_p, 0.2);
    EXPECT_EQ(config.network_seed, 9ul);
    EXPECT_DOUBLE_EQ(config.contagiousness, 0.1);
    EXPECT_DOUBLE_EQ(config.incubation_zeta, 1.0);
    EXPECT_DOUBLE_EQ(config.incubation_sigma, 0.4);
    EXPECT_DOUBLE_EQ(config.sickness_zeta, 1.5);
    EXPECT_DOUBLE_EQ(config.sickness_sigma, 0.6);
    EXPECT_EQ(config.max_gathering_size, 8u);
    EXPECT_EQ(config.min_connections, 4);
    EXPECT_EQ(config.delay, 12);
    EXPECT_EQ(config.ndays, 60);
    EXPECT_EQ(config.initial_cases, 2u);
    EXPECT_EQ(config.initial_incubation_days, 1);
    EXPECT_EQ(config.replicates, 5u);
    EXPECT_EQ(config.rng_seed, 77ul);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(SimulationConfigTest, UnknownKeyIgnored) {
    SimulationConfig config = loadSimulationConfig(writeFile("unknown.txt", "flux_capacitor 1.21\nndays 30\n"));
    EXPECT_EQ(config.ndays, 30);
}

TEST_F(SimulationConfigTest, MissingFile) {
    EXPECT_THROW(loadSimulationConfig("does_not_exist.txt"), FileIOException);
}

TEST_F(SimulationConfigTest, MalformedValues) {
    EXPECT_THROW(loadSimulationConfig(writeFile("nan.txt", "contagiousness high\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("partial.txt", "ndays 12abc\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("novalue.txt", "delay\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("extra.txt", "delay 3 4\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("negsize.txt", "population_size -5\n")), DataFormatException);
}

TEST_F(SimulationConfigTest, OutOfRangeValues) {
    EXPECT_THROW(loadSimulationConfig(writeFile("p.txt", "contagiousness 1.5\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("np.txt", "network_p -0.1\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("m.txt", "population_size 4\nnetwork_m 5\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("min.txt", "min_connections -1\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("days.txt", "ndays -1\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("cases.txt", "population_size 10\ninitial_cases 11\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("rep.txt", "replicates 0\n")), DataFormatException);
    EXPECT_THROW(loadSimulationConfig(writeFile("log.txt", "log_level chatty\n")), DataFormatException);
}
