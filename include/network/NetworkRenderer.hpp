#ifndef NETWORK_RENDERER_HPP
#define NETWORK_RENDERER_HPP

#include "model/Population.hpp"
#include <ostream>
#include <string>

namespace netepi {

/**
 * @class NetworkRenderer
 * @brief Writes a population's contact network as a Graphviz graph, nodes coloured by health state.
 *
 * Nodes are points, grey by default; incubating cases are outlined yellow and filled orange,
 * sick cases outlined orange and filled red, recovered individuals black. The output
 * asks for the neato layout, e.g. `neato -Tsvg network.dot > network.svg`.
 */
class NetworkRenderer {
public:
    NetworkRenderer() = delete;

    /**
     * @brief Writes the DOT description of `population` to `out`.
     * @param size Graphviz drawing size attribute, in inches.
     */
    static void writeDot(const Population& population, std::ostream& out,
                         const std::string& size = "7.75,10.25");

    /**
     * @brief Writes the DOT description of `population` to `filename`.
     * @throws FileIOException if the file cannot be opened.
     */
    static void saveDot(const Population& population, const std::string& filename,
                        const std::string& size = "7.75,10.25");
};

} // namespace netepi

#endif // NETWORK_RENDERER_HPP
