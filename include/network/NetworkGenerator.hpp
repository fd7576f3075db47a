#ifndef NETWORK_GENERATOR_HPP
#define NETWORK_GENERATOR_HPP

#include "network/ContactNetwork.hpp"
#include "model/interfaces/IRandomSource.hpp"
#include <cstddef>

namespace netepi {

/**
 * @namespace NetworkGenerator
 * @brief Random contact-network topologies.
 */
namespace NetworkGenerator {

    /**
     * @brief Power-law graph with tunable clustering (Holme and Kim, 2002).
     *
     * Starts from `m` isolated nodes. Every further node attaches to `m` existing nodes:
     * the first by preferential attachment, and each following one either closes a
     * triangle with the previous target (probability `p`, when such a neighbor exists)
     * or by preferential attachment again. The result has at most m*(n-m) contacts,
     * exactly m*(n-m) when `p` is 0.
     *
     * @param n Number of nodes.
     * @param m Contacts added per new node.
     * @param p Probability of a triad-formation step.
     * @param rng Random source for all choices.
     * @return ContactNetwork The generated network.
     *
     * @throws InvalidParameterException if m < 1, m > n, or p is outside [0, 1].
     */
    ContactNetwork powerlawClusterGraph(std::size_t n, std::size_t m, double p, IRandomSource& rng);

} // namespace NetworkGenerator
} // namespace netepi

#endif // NETWORK_GENERATOR_HPP
