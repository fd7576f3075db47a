#ifndef CONTACT_NETWORK_HPP
#define CONTACT_NETWORK_HPP

#include <boost/graph/adjacency_list.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace netepi {

/** @brief Identifier of an individual; stable for the lifetime of a ContactNetwork. */
using NodeId = std::size_t;

/** @brief An undirected contact between two individuals. */
using Edge = std::pair<NodeId, NodeId>;

/** @brief A collection of undirected contacts. */
using EdgeList = std::vector<Edge>;

/**
 * @class ContactNetwork
 * @brief Undirected simple graph of possible transmission contacts between individuals.
 *
 * Nodes are the integers 0 .. n-1 and are fixed once the network is built; only the
 * edge set can change, through addEdges() and removeEdges(). The out-edge storage is
 * an ordered set, so neighbors() always returns identifiers in ascending order. Code
 * that depends on the neighbor order (the gathering-size intervention) therefore gives
 * the same result for the same edge set.
 */
class ContactNetwork {
public:
    using Graph = boost::adjacency_list<boost::setS, boost::vecS, boost::undirectedS>;

    /**
     * @brief Creates a network of `node_count` isolated individuals.
     * @param node_count Number of individuals.
     */
    explicit ContactNetwork(std::size_t node_count = 0);

    /**
     * @brief Creates a network of `node_count` individuals connected by `edges`.
     * @throws InvalidParameterException if an edge references a node outside [0, node_count)
     *         or joins a node to itself.
     */
    ContactNetwork(std::size_t node_count, const EdgeList& edges);

    /** @brief Number of individuals. */
    std::size_t numNodes() const;

    /** @brief Number of undirected contacts. */
    std::size_t numEdges() const;

    /** @brief All node identifiers, ascending. */
    std::vector<NodeId> nodes() const;

    /**
     * @brief Number of contacts of `node`.
     * @throws InvalidParameterException if `node` is not in the network.
     */
    std::size_t degree(NodeId node) const;

    /**
     * @brief Contacts of `node` in ascending identifier order.
     * @throws InvalidParameterException if `node` is not in the network.
     */
    std::vector<NodeId> neighbors(NodeId node) const;

    /** @brief True if `node` is a valid identifier. */
    bool hasNode(NodeId node) const;

    /** @brief True if `u` and `v` are in contact. Unknown nodes are never in contact. */
    bool hasEdge(NodeId u, NodeId v) const;

    /**
     * @brief Adds every pair of `edges`. Pairs already present are ignored.
     * @throws InvalidParameterException for self-loops or unknown nodes; no edge is added then.
     */
    void addEdges(const EdgeList& edges);

    /**
     * @brief Removes every pair of `edges`. Pairs not present are ignored.
     *
     * Pairs are unordered: (u, v) and (v, u) name the same contact.
     */
    void removeEdges(const EdgeList& edges);

    /**
     * @brief All contacts as unordered pairs, normalized to (min, max) and sorted.
     *
     * Two networks with equal edges() have identical contact sets.
     */
    EdgeList edges() const;

    /** @brief Read access to the underlying Boost graph (e.g. for Graphviz output). */
    const Graph& graph() const { return graph_; }

private:
    void checkNode(NodeId node, const char* function) const;

    Graph graph_;
};

} // namespace netepi

#endif // CONTACT_NETWORK_HPP
