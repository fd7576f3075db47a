#include "network/ContactNetwork.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <string>
#include <tuple>

namespace netepi {

ContactNetwork::ContactNetwork(std::size_t node_count)
    : graph_(node_count) {}

ContactNetwork::ContactNetwork(std::size_t node_count, const EdgeList& edges)
    : graph_(node_count) {
    addEdges(edges);
}

std::size_t ContactNetwork::numNodes() const {
    return boost::num_vertices(graph_);
}

std::size_t ContactNetwork::numEdges() const {
    return boost::num_edges(graph_);
}

std::vector<NodeId> ContactNetwork::nodes() const {
    std::vector<NodeId> result;
    result.reserve(numNodes());
    Graph::vertex_iterator vi, vi_end;
    for (std::tie(vi, vi_end) = boost::vertices(graph_); vi != vi_end; ++vi) {
        result.push_back(*vi);
    }
    return result;
}

bool ContactNetwork::hasNode(NodeId node) const {
    return node < numNodes();
}

void ContactNetwork::checkNode(NodeId node, const char* function) const {
    if (!hasNode(node)) {
        THROW_INVALID_PARAM(function, "Node " + std::to_string(node) +
                            " is not in the network (size " + std::to_string(numNodes()) + ").");
    }
}

std::size_t ContactNetwork::degree(NodeId node) const {
    checkNode(node, "ContactNetwork::degree");
    return boost::out_degree(node, graph_);
}

std::vector<NodeId> ContactNetwork::neighbors(NodeId node) const {
    checkNode(node, "ContactNetwork::neighbors");
    std::vector<NodeId> result;
    result.reserve(boost::out_degree(node, graph_));
    Graph::adjacency_iterator start, end;
    for (std::tie(start, end) = boost::adjacent_vertices(node, graph_); start != end; ++start) {
        result.push_back(*start);
    }
    return result;
}

bool ContactNetwork::hasEdge(NodeId u, NodeId v) const {
    if (!hasNode(u) || !hasNode(v)) {
        return false;
    }
    return boost::edge(u, v, graph_).second;
}

void ContactNetwork::addEdges(const EdgeList& edges) {
    for (const auto& e : edges) {
        checkNode(e.first, "ContactNetwork::addEdges");
        checkNode(e.second, "ContactNetwork::addEdges");
        if (e.first == e.second) {
            THROW_INVALID_PARAM("ContactNetwork::addEdges",
                                "Self-contact on node " + std::to_string(e.first) + " is not allowed.");
        }
    }
    for (const auto& e : edges) {
        boost::add_edge(e.first, e.second, graph_);
    }
}

void ContactNetwork::removeEdges(const EdgeList& edges) {
    for (const auto& e : edges) {
        if (hasEdge(e.first, e.second)) {
            boost::remove_edge(e.first, e.second, graph_);
        }
    }
}

EdgeList ContactNetwork::edges() const {
    EdgeList result;
    result.reserve(numEdges());
    Graph::edge_iterator ei, ei_end;
    for (std::tie(ei, ei_end) = boost::edges(graph_); ei != ei_end; ++ei) {
        NodeId u = boost::source(*ei, graph_);
        NodeId v = boost::target(*ei, graph_);
        result.emplace_back(std::min(u, v), std::max(u, v));
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace netepi
