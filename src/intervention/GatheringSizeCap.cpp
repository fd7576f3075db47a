#include "intervention/GatheringSizeCap.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <string>

namespace netepi {

GatheringSizeCap::GatheringSizeCap(std::size_t max_size, long min_connections)
    : max_size_(max_size), min_connections_(min_connections) {}

EdgeList GatheringSizeCap::connectionsToCancel(const ContactNetwork& network) const {
    EdgeList cancelled;
    for (NodeId person : network.nodes()) {
        const std::size_t n_connections = network.degree(person);
        if (n_connections < max_size_) {
            continue;
        }
        const std::vector<NodeId> contacts = network.neighbors(person);
        for (std::size_t i = 0; i < contacts.size(); ++i) {
            const long remaining = static_cast<long>(n_connections) - static_cast<long>(i);
            if (remaining <= min_connections_) {
                break;
            }
            cancelled.emplace_back(person, contacts[i]);
        }
    }
    return cancelled;
}

EdgeList GatheringSizeCap::cancel(ContactNetwork& network) const {
    EdgeList marked = connectionsToCancel(network);
    EdgeList removed;
    removed.reserve(marked.size());
    for (const auto& e : marked) {
        removed.emplace_back(std::min(e.first, e.second), std::max(e.first, e.second));
    }
    std::sort(removed.begin(), removed.end());
    removed.erase(std::unique(removed.begin(), removed.end()), removed.end());

    network.removeEdges(removed);
    Logger::getInstance().info("GatheringSizeCap::cancel",
                               "Cancelled " + std::to_string(removed.size()) + " contacts (max_size=" +
                               std::to_string(max_size_) + ", min_connections=" +
                               std::to_string(min_connections_) + ").");
    return removed;
}

void GatheringSizeCap::restore(ContactNetwork& network, const EdgeList& cancelled) {
    network.addEdges(cancelled);
    Logger::getInstance().info("GatheringSizeCap::restore",
                               "Restored " + std::to_string(cancelled.size()) + " contacts.");
}

} // namespace netepi
