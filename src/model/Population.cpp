#include "model/Population.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <string>
#include <utility>
#include <vector>

namespace netepi {

Population::Population(std::shared_ptr<ContactNetwork> network)
    : network_(std::move(network)) {
    if (!network_) {
        THROW_INVALID_PARAM("Population::Population", "Contact network pointer cannot be null.");
    }
    reset();
}

void Population::reset() {
    const std::vector<NodeId> all = network_->nodes();
    susceptible_ = NodeSet(all.begin(), all.end());
    incubating_.clear();
    sick_.clear();
    recovered_.clear();
    Logger::getInstance().debug("Population::reset",
                                "All " + std::to_string(susceptible_.size()) + " individuals susceptible.");
}

PopulationSnapshot Population::snapshot() const {
    PopulationSnapshot s;
    s.susceptible = susceptible_.size();
    s.incubating = incubating_.size();
    s.sick = sick_.size();
    s.recovered = recovered_.size();
    return s;
}

bool Population::isConsistent() const {
    const std::size_t n = network_->numNodes();
    if (snapshot().total() != n) {
        return false;
    }
    // Equal total plus every node in exactly one group implies disjointness.
    std::vector<int> seen(n, 0);
    auto mark = [&seen, n](NodeId id) {
        if (id >= n) return false;
        return ++seen[id] == 1;
    };
    for (NodeId id : susceptible_) if (!mark(id)) return false;
    for (const auto& kv : incubating_) if (!mark(kv.first)) return false;
    for (const auto& kv : sick_) if (!mark(kv.first)) return false;
    for (NodeId id : recovered_) if (!mark(id)) return false;
    return true;
}

} // namespace netepi
