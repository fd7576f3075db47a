#ifndef POPULATION_HPP
#define POPULATION_HPP

#include "network/ContactNetwork.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <set>

namespace netepi {

/** @brief Members with no attached data (susceptible, recovered). */
using NodeSet = std::set<NodeId>;

/** @brief Members with a remaining-days counter (incubating, sick). */
using CountdownMap = std::map<NodeId, int>;

/**
 * @brief Aggregate health-state counts of a population at one instant.
 */
struct PopulationSnapshot {
    std::size_t susceptible = 0;
    std::size_t incubating = 0;
    std::size_t sick = 0;
    std::size_t recovered = 0;

    std::size_t total() const { return susceptible + incubating + sick + recovered; }
};

/**
 * @class Population
 * @brief Health state of every individual of a contact network.
 *
 * Each individual is in exactly one of four groups:
 * - susceptible,
 * - incubating, with the remaining days until symptoms,
 * - sick, with the remaining days until recovery,
 * - recovered (terminal).
 *
 * The groups are pairwise disjoint and together cover every node of the bound network.
 * Groups are changed only by the StepEngine and the SimulationDriver through the
 * mutable accessors below.
 *
 * The network is shared, not owned: interventions add and remove contacts on it while
 * the population is in use, so nothing here caches connectivity.
 */
class Population {
public:
    /**
     * @brief Creates a fully susceptible population over `network`.
     * @throws InvalidParameterException if `network` is null.
     */
    explicit Population(std::shared_ptr<ContactNetwork> network);

    /**
     * @brief Makes every individual susceptible again. The network is left untouched.
     */
    void reset();

    ContactNetwork& getNetwork() { return *network_; }
    const ContactNetwork& getNetwork() const { return *network_; }
    std::shared_ptr<ContactNetwork> getNetworkPtr() const { return network_; }

    NodeSet& susceptible() { return susceptible_; }
    const NodeSet& susceptible() const { return susceptible_; }
    CountdownMap& incubating() { return incubating_; }
    const CountdownMap& incubating() const { return incubating_; }
    CountdownMap& sick() { return sick_; }
    const CountdownMap& sick() const { return sick_; }
    NodeSet& recovered() { return recovered_; }
    const NodeSet& recovered() const { return recovered_; }

    /** @brief Number of individuals (nodes of the network). */
    std::size_t size() const { return network_->numNodes(); }

    /** @brief Current group sizes. */
    PopulationSnapshot snapshot() const;

    /**
     * @brief Checks the partition invariant.
     * @return true if the groups are disjoint and their union is exactly the node set.
     */
    bool isConsistent() const;

private:
    std::shared_ptr<ContactNetwork> network_;
    NodeSet susceptible_;
    CountdownMap incubating_;
    CountdownMap sick_;
    NodeSet recovered_;
};

} // namespace netepi

#endif // POPULATION_HPP
