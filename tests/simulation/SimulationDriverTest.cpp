#include "gtest/gtest.h"
#include "simulation/SimulationDriver.hpp"
#include "model/DurationSamplers.hpp"
#include "model/GslRandomSource.hpp"
#include "network/NetworkGenerator.hpp"
#include "exceptions/Exceptions.hpp"
#include "support/ScriptedRandomSource.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace netepi;
using netepi::test_support::ScriptedRandomSource;

namespace {

// Calls a test-supplied function for every recorded day.
class CallbackRecorder : public IRecorder {
public:
    explicit CallbackRecorder(std::function<void(int, const Population&)> fn) : fn_(std::move(fn)) {}
    void record(int day, const Population& population) override { fn_(day, population); }

private:
    std::function<void(int, const Population&)> fn_;
};

// Hub 0 with nine leaves: a cap of (5, 2) removes seven of its contacts.
std::shared_ptr<ContactNetwork> starOfTen() {
    EdgeList edges;
    for (NodeId leaf = 1; leaf < 10; ++leaf) edges.emplace_back(0, leaf);
    return std::make_shared<ContactNetwork>(10, edges);
}

} // namespace

class SimulationDriverTest : public ::testing::Test {
protected:
    std::shared_ptr<ContactNetwork> network;
    std::shared_ptr<Population> population;

    void SetUp() override {
        network = starOfTen();
        population = std::make_shared<Population>(network);
    }

    SimulationDriver makeDriver(double contagiousness, std::size_t max_size = 5, long min_connections = 2) {
        auto disease = std::make_shared<DiseaseModel>(contagiousness,
                                                      std::make_shared<FixedDurationSampler>(3.0),
                                                      std::make_shared<FixedDurationSampler>(3.0));
        auto engine = std::make_shared<StepEngine>(disease, std::make_shared<ScriptedRandomSource>());
        return SimulationDriver(engine, GatheringSizeCap(max_size, min_connections));
    }
};

TEST_F(SimulationDriverTest, NullEngineRejected) {
    EXPECT_THROW(SimulationDriver(nullptr, GatheringSizeCap(5)), InvalidParameterException);
}

TEST_F(SimulationDriverTest, SingleIndexCaseWithoutContagion) {
    SimulationDriver driver = makeDriver(0.0);
    std::vector<int> counters;
    Monitor monitor;
    CallbackRecorder recorder([&](int day, const Population& p) {
        monitor.record(day, p);
        counters.push_back(p.incubating().at(3));
    });

    driver.simulateCancelledEvents(*population, {{3, 2}}, 1, 3, recorder);

    EXPECT_EQ(monitor.day, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(monitor.susceptible, (std::vector<int>{9, 9, 9}));
    EXPECT_EQ(monitor.incubating, (std::vector<int>{1, 1, 1}));
    EXPECT_EQ(monitor.sick, (std::vector<int>{0, 0, 0}));
    EXPECT_EQ(counters, (std::vector<int>{2, 1, 0}));

    // Day 2's transition moved the case into the sick group.
    EXPECT_EQ(population->sick().count(3), 1u);
    EXPECT_TRUE(population->incubating().empty());
    EXPECT_EQ(population->susceptible().size(), 9u);
}

TEST_F(SimulationDriverTest, ReturnsMonitorWithOneEntryPerDay) {
    SimulationDriver driver = makeDriver(0.5);
    Monitor monitor = driver.simulateCancelledEvents(*population, {{0, 1}}, 4, 12);
    EXPECT_EQ(monitor.size(), 12u);
    EXPECT_TRUE(monitor.isValid());
    for (int d = 0; d < 12; ++d) {
        EXPECT_EQ(monitor.day[d], d);
        EXPECT_EQ(monitor.susceptible[d] + monitor.incubating[d] + monitor.sick[d] + monitor.recovered[d], 10);
    }
    EXPECT_EQ(monitor.susceptible[0], 9);
    EXPECT_EQ(monitor.incubating[0], 1);
}

TEST_F(SimulationDriverTest, CapAppliesFromDelayAndIsLiftedAfterRun) {
    SimulationDriver driver = makeDriver(0.0);
    const EdgeList before = network->edges();
    std::vector<std::size_t> hub_degree;
    CallbackRecorder recorder([&](int, const Population& p) {
        hub_degree.push_back(p.getNetwork().degree(0));
        EXPECT_TRUE(p.isConsistent());
    });

    driver.simulateCancelledEvents(*population, {{5, 1}}, 2, 5, recorder);

    EXPECT_EQ(hub_degree, (std::vector<std::size_t>{9, 9, 2, 2, 2}));
    EXPECT_EQ(network->edges(), before);
}

TEST_F(SimulationDriverTest, ZeroDelayCapsFromDayZero) {
    SimulationDriver driver = makeDriver(0.0);
    std::vector<std::size_t> hub_degree;
    CallbackRecorder recorder([&](int, const Population& p) { hub_degree.push_back(p.getNetwork().degree(0)); });

    driver.simulateCancelledEvents(*population, {{5, 1}}, 0, 3, recorder);

    EXPECT_EQ(hub_degree, (std::vector<std::size_t>{2, 2, 2}));
    EXPECT_EQ(network->degree(0), 9u);
}

TEST_F(SimulationDriverTest, DelayBeyondRunNeverCaps) {
    SimulationDriver driver = makeDriver(0.0);
    std::vector<std::size_t> hub_degree;
    CallbackRecorder recorder([&](int, const Population& p) { hub_degree.push_back(p.getNetwork().degree(0)); });

    driver.simulateCancelledEvents(*population, {{5, 1}}, 10, 4, recorder);

    EXPECT_EQ(hub_degree, (std::vector<std::size_t>{9, 9, 9, 9}));
    EXPECT_EQ(network->degree(0), 9u);
}

TEST_F(SimulationDriverTest, CapBlocksTransmissionThroughCancelledContacts) {
    // Contagiousness 1 from the hub; with delay 0 only the kept leaves 8 and 9 get infected.
    SimulationDriver driver = makeDriver(1.0);
    driver.simulateCancelledEvents(*population, {{0, 5}}, 0, 2);

    EXPECT_EQ(population->incubating().count(8), 1u);
    EXPECT_EQ(population->incubating().count(9), 1u);
    for (NodeId leaf = 1; leaf <= 7; ++leaf) {
        EXPECT_EQ(population->susceptible().count(leaf), 1u) << "leaf " << leaf;
    }
}

TEST_F(SimulationDriverTest, ResetsPopulationBeforeRun) {
    SimulationDriver driver = makeDriver(0.0);
    population->susceptible().erase(7);
    population->recovered().insert(7);

    Monitor monitor = driver.simulateCancelledEvents(*population, {{1, 0}}, 0, 1);
    EXPECT_EQ(monitor.recovered[0], 0);
    EXPECT_EQ(monitor.susceptible[0], 9);
}

TEST_F(SimulationDriverTest, InvalidArgumentsRejected) {
    SimulationDriver driver = makeDriver(0.0);
    EXPECT_THROW(driver.simulateCancelledEvents(*population, {{1, 1}}, -1, 3), InvalidParameterException);
    EXPECT_THROW(driver.simulateCancelledEvents(*population, {{1, 1}}, 0, -3), InvalidParameterException);
    EXPECT_THROW(driver.simulateCancelledEvents(*population, {{10, 1}}, 0, 3), InvalidParameterException);
}

TEST_F(SimulationDriverTest, NetworkRestoredWhenRunFails) {
    SimulationDriver driver = makeDriver(0.0);
    const EdgeList before = network->edges();
    CallbackRecorder recorder([](int day, const Population&) {
        if (day == 2) throw std::runtime_error("recorder failure");
    });

    EXPECT_THROW(driver.simulateCancelledEvents(*population, {{5, 1}}, 1, 5, recorder), SimulationException);
    EXPECT_EQ(network->edges(), before);
}

TEST(SimulationDriverRandomTest, PartitionHoldsEveryDay) {
    GslRandomSource network_rng(4);
    auto network = std::make_shared<ContactNetwork>(NetworkGenerator::powerlawClusterGraph(400, 5, 1.0 / 3.0, network_rng));
    Population population(network);
    auto engine = std::make_shared<StepEngine>(std::make_shared<DiseaseModel>(0.1),
                                               std::make_shared<GslRandomSource>(77));
    SimulationDriver driver(engine, GatheringSizeCap(10, 5));
    const EdgeList before = network->edges();

    NodeSet recovered_so_far;
    CallbackRecorder recorder([&](int day, const Population& p) {
        ASSERT_TRUE(p.isConsistent()) << "day " << day;
        for (NodeId id : recovered_so_far) {
            ASSERT_EQ(p.recovered().count(id), 1u);
        }
        recovered_so_far = p.recovered();
    });

    driver.simulateCancelledEvents(population, {{0, 3}, {1, 3}, {2, 3}}, 15, 90, recorder);

    EXPECT_TRUE(population.isConsistent());
    EXPECT_EQ(network->edges(), before);
}
