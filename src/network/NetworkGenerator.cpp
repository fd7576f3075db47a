#include "network/NetworkGenerator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <set>
#include <string>
#include <vector>

namespace netepi {
namespace NetworkGenerator {

namespace {

// m distinct elements drawn from `seq` with probability proportional to multiplicity.
std::vector<NodeId> randomSubset(const std::vector<NodeId>& seq, std::size_t m, IRandomSource& rng) {
    std::set<NodeId> chosen;
    std::vector<NodeId> ordered;
    while (chosen.size() < m) {
        NodeId x = seq[rng.uniformInt(seq.size())];
        if (chosen.insert(x).second) {
            ordered.push_back(x);
        }
    }
    return ordered;
}

} // namespace

ContactNetwork powerlawClusterGraph(std::size_t n, std::size_t m, double p, IRandomSource& rng) {
    if (m < 1 || n < m) {
        THROW_INVALID_PARAM("NetworkGenerator::powerlawClusterGraph",
                            "Need 1 <= m <= n. Got m=" + std::to_string(m) + ", n=" + std::to_string(n) + ".");
    }
    if (p < 0.0 || p > 1.0) {
        THROW_INVALID_PARAM("NetworkGenerator::powerlawClusterGraph",
                            "Triad probability must be in [0, 1]. Got " + std::to_string(p) + ".");
    }

    ContactNetwork network(n);
    std::vector<NodeId> repeated_nodes;
    for (NodeId i = 0; i < m; ++i) {
        repeated_nodes.push_back(i);
    }

    for (NodeId source = m; source < n; ++source) {
        std::vector<NodeId> possible_targets = randomSubset(repeated_nodes, m, rng);
        NodeId target = possible_targets.back();
        possible_targets.pop_back();
        network.addEdges({{source, target}});
        repeated_nodes.push_back(target);

        std::size_t count = 1;
        while (count < m) {
            if (rng.uniform() < p) {
                std::vector<NodeId> neighborhood;
                for (NodeId nbr : network.neighbors(target)) {
                    if (nbr != source && !network.hasEdge(source, nbr)) {
                        neighborhood.push_back(nbr);
                    }
                }
                if (!neighborhood.empty()) {
                    NodeId nbr = neighborhood[rng.uniformInt(neighborhood.size())];
                    network.addEdges({{source, nbr}});
                    repeated_nodes.push_back(nbr);
                    ++count;
                    continue;
                }
            }
            target = possible_targets.back();
            possible_targets.pop_back();
            network.addEdges({{source, target}});
            repeated_nodes.push_back(target);
            ++count;
        }
        repeated_nodes.insert(repeated_nodes.end(), m, source);
    }

    Logger::getInstance().info("NetworkGenerator::powerlawClusterGraph",
                               "Generated network: " + std::to_string(network.numNodes()) + " nodes, " +
                               std::to_string(network.numEdges()) + " contacts (m=" + std::to_string(m) +
                               ", p=" + std::to_string(p) + ").");
    return network;
}

} // namespace NetworkGenerator
} // namespace netepi
