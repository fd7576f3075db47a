#include "network/NetworkRenderer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <boost/graph/graphviz.hpp>
#include <fstream>

namespace netepi {

namespace {

class HealthStateWriter {
public:
    explicit HealthStateWriter(const Population& population) : population_(population) {}

    template <class Vertex>
    void operator()(std::ostream& out, const Vertex& v) const {
        const NodeId id = static_cast<NodeId>(v);
        if (population_.incubating().count(id)) {
            out << "[color=\"yellow\", fillcolor=\"orange\"]";
        } else if (population_.sick().count(id)) {
            out << "[color=\"orange\", fillcolor=\"red\"]";
        } else if (population_.recovered().count(id)) {
            out << "[color=\"black\"]";
        }
    }

private:
    const Population& population_;
};

class GraphAttributeWriter {
public:
    explicit GraphAttributeWriter(const std::string& size) : size_(size) {}

    void operator()(std::ostream& out) const {
        out << "graph [size=\"" << size_ << "\", layout=\"neato\"]\n";
        out << "node [shape=\"point\", style=\"filled\", color=\"#b0b0b0b0\"]\n";
        out << "edge [color=\"#b0b0b0b0\"]\n";
    }

private:
    std::string size_;
};

} // namespace

void NetworkRenderer::writeDot(const Population& population, std::ostream& out, const std::string& size) {
    boost::write_graphviz(out, population.getNetwork().graph(),
                          HealthStateWriter(population),
                          boost::default_writer(),
                          GraphAttributeWriter(size));
}

void NetworkRenderer::saveDot(const Population& population, const std::string& filename, const std::string& size) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw FileIOException("NetworkRenderer::saveDot", "Could not open file for writing: " + filename);
    }
    writeDot(population, file, size);
    Logger::getInstance().info("NetworkRenderer::saveDot", "Network written to " + filename);
}

} // namespace netepi
