#include "gtest/gtest.h"
#include "network/NetworkRenderer.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <sstream>
#include <string>

using namespace netepi;

class NetworkRendererTest : public ::testing::Test {
protected:
    std::shared_ptr<ContactNetwork> network;
    std::shared_ptr<Population> population;

    void SetUp() override {
        network = std::make_shared<ContactNetwork>(4, EdgeList{{0, 1}, {1, 2}, {2, 3}});
        population = std::make_shared<Population>(network);
        population->susceptible().erase(1);
        population->incubating()[1] = 2;
        population->susceptible().erase(2);
        population->sick()[2] = 1;
        population->susceptible().erase(3);
        population->recovered().insert(3);
    }
};

TEST_F(NetworkRendererTest, WritesUndirectedGraphWithStateColours) {
    std::ostringstream out;
    NetworkRenderer::writeDot(*population, out);
    const std::string dot = out.str();

    EXPECT_NE(dot.find("graph G {"), std::string::npos);
    EXPECT_NE(dot.find("layout=\"neato\""), std::string::npos);
    EXPECT_NE(dot.find("shape=\"point\""), std::string::npos);
    EXPECT_NE(dot.find("1[color=\"yellow\", fillcolor=\"orange\"]"), std::string::npos);
    EXPECT_NE(dot.find("2[color=\"orange\", fillcolor=\"red\"]"), std::string::npos);
    EXPECT_NE(dot.find("3[color=\"black\"]"), std::string::npos);
    EXPECT_NE(dot.find("0--1"), std::string::npos);
    EXPECT_NE(dot.find("2--3"), std::string::npos);
}

TEST_F(NetworkRendererTest, DoesNotChangePopulation) {
    std::ostringstream out;
    NetworkRenderer::writeDot(*population, out);
    EXPECT_TRUE(population->isConsistent());
    EXPECT_EQ(network->numEdges(), 3u);
}

TEST_F(NetworkRendererTest, UnwritablePathThrows) {
    EXPECT_THROW(NetworkRenderer::saveDot(*population, "/nonexistent_dir/network.dot"), FileIOException);
}
