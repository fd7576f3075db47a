#include "gtest/gtest.h"
#include "intervention/GatheringSizeCap.hpp"
#include "model/GslRandomSource.hpp"
#include "network/NetworkGenerator.hpp"
#include <vector>

using namespace netepi;

namespace {

// Hub 0 joined to 1..8, hub 9 joined to 10..15, plus a leaf pair 16-17.
ContactNetwork twoHubs() {
    EdgeList edges;
    for (NodeId leaf = 1; leaf <= 8; ++leaf) edges.emplace_back(0, leaf);
    for (NodeId leaf = 10; leaf <= 15; ++leaf) edges.emplace_back(9, leaf);
    edges.emplace_back(16, 17);
    return ContactNetwork(18, edges);
}

} // namespace

TEST(GatheringSizeCapTest, CancelsEarliestNeighborsAndKeepsTail) {
    ContactNetwork network = twoHubs();
    GatheringSizeCap cap(7, 5);

    EdgeList marked = cap.connectionsToCancel(network);

    // Hub 0 has degree 8: positions 0,1,2 are cancelled, 8-3 = 5 stops the walk.
    EdgeList expected = {{0, 1}, {0, 2}, {0, 3}};
    EXPECT_EQ(marked, expected);
}

TEST(GatheringSizeCapTest, DegreeBelowMaxSizeUntouched) {
    ContactNetwork network = twoHubs();
    GatheringSizeCap cap(9, 2);
    EXPECT_TRUE(cap.connectionsToCancel(network).empty());
}

TEST(GatheringSizeCapTest, DegreeEqualToMaxSizeIsCapped) {
    ContactNetwork network = twoHubs();
    GatheringSizeCap cap(6, 4);
    EdgeList marked = cap.connectionsToCancel(network);

    std::size_t from_hub0 = 0, from_hub9 = 0;
    for (const auto& e : marked) {
        if (e.first == 0) ++from_hub0;
        if (e.first == 9) ++from_hub9;
    }
    EXPECT_EQ(from_hub0, 4u);
    EXPECT_EQ(from_hub9, 2u);
}

TEST(GatheringSizeCapTest, CancelRemovesAndRestoreReverts) {
    ContactNetwork network = twoHubs();
    const EdgeList before = network.edges();
    GatheringSizeCap cap(6, 4);

    EdgeList removed = cap.cancel(network);
    EXPECT_EQ(removed.size(), 6u);
    EXPECT_EQ(network.degree(0), 4u);
    EXPECT_EQ(network.degree(9), 4u);
    EXPECT_EQ(network.neighbors(0), (std::vector<NodeId>{5, 6, 7, 8}));
    EXPECT_TRUE(network.hasEdge(16, 17));

    GatheringSizeCap::restore(network, removed);
    EXPECT_EQ(network.edges(), before);
}

TEST(GatheringSizeCapTest, EdgeCancelledFromBothEndsRemovedOnce) {
    // Two hubs joined directly: both want to cancel the 0-1 contact.
    EdgeList edges = {{0, 1}};
    for (NodeId leaf = 2; leaf <= 4; ++leaf) edges.emplace_back(0, leaf);
    for (NodeId leaf = 5; leaf <= 7; ++leaf) edges.emplace_back(1, leaf);
    ContactNetwork network(8, edges);
    const EdgeList before = network.edges();
    GatheringSizeCap cap(4, 3);

    EdgeList marked = cap.connectionsToCancel(network);
    EXPECT_EQ(marked, (EdgeList{{0, 1}, {1, 0}}));

    EdgeList removed = cap.cancel(network);
    EXPECT_EQ(removed, (EdgeList{{0, 1}}));
    EXPECT_FALSE(network.hasEdge(0, 1));
    EXPECT_EQ(network.numEdges(), before.size() - 1);

    GatheringSizeCap::restore(network, removed);
    EXPECT_EQ(network.edges(), before);
}

TEST(GatheringSizeCapTest, DefaultMinConnectionsIsFive) {
    GatheringSizeCap cap(10);
    EXPECT_EQ(cap.getMaxSize(), 10u);
    EXPECT_EQ(cap.getMinConnections(), 5);
}

TEST(GatheringSizeCapTest, ReversibleOnGeneratedNetwork) {
    GslRandomSource rng(17);
    ContactNetwork network = NetworkGenerator::powerlawClusterGraph(500, 5, 1.0 / 3.0, rng);
    const EdgeList before = network.edges();
    std::vector<std::size_t> degrees;
    for (NodeId id : network.nodes()) degrees.push_back(network.degree(id));

    GatheringSizeCap cap(10, 5);
    EdgeList marked = cap.connectionsToCancel(network);
    for (const auto& e : marked) {
        EXPECT_GE(degrees[e.first], 10u) << "cancellation initiated by node " << e.first;
    }

    EdgeList removed = cap.cancel(network);
    EXPECT_FALSE(removed.empty());
    EXPECT_EQ(network.numEdges(), before.size() - removed.size());

    GatheringSizeCap::restore(network, removed);
    EXPECT_EQ(network.edges(), before);
}
