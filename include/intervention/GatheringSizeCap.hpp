#ifndef GATHERING_SIZE_CAP_HPP
#define GATHERING_SIZE_CAP_HPP

#include "network/ContactNetwork.hpp"
#include <cstddef>

namespace netepi {

/**
 * @class GatheringSizeCap
 * @brief Intervention that cancels gatherings by temporarily removing contacts.
 *
 * Every individual whose degree is at least `max_size` loses contacts, taken in the
 * network's neighbor order (ascending id), until only `min_connections` remain. The
 * retained contacts are the last ones in that order. Individuals below `max_size`
 * keep all of their contacts, except those cancelled from the other side.
 *
 * `min_connections` is not validated; a negative value gives undefined results.
 */
class GatheringSizeCap {
public:
    /**
     * @param max_size Degree from which an individual's contacts are capped.
     * @param min_connections Contacts each capped individual keeps. Defaults to 5.
     */
    explicit GatheringSizeCap(std::size_t max_size, long min_connections = 5);

    /**
     * @brief Computes the contacts to cancel on the current network, without modifying it.
     *
     * For each individual with degree >= max_size, the neighbor at position i (0-based)
     * is cancelled unless (degree - i) <= min_connections, at which point the remaining
     * neighbors are kept. A contact cancelled from both ends appears twice; removal treats
     * pairs as unordered so this is harmless.
     *
     * @return EdgeList Pairs (individual, neighbor) to remove.
     */
    EdgeList connectionsToCancel(const ContactNetwork& network) const;

    /**
     * @brief Removes the contacts returned by connectionsToCancel.
     * @return EdgeList The distinct removed contacts, to pass to restore().
     */
    EdgeList cancel(ContactNetwork& network) const;

    /**
     * @brief Adds back previously cancelled contacts, unconditionally.
     */
    static void restore(ContactNetwork& network, const EdgeList& cancelled);

    std::size_t getMaxSize() const { return max_size_; }
    long getMinConnections() const { return min_connections_; }

private:
    std::size_t max_size_;
    long min_connections_;
};

} // namespace netepi

#endif // GATHERING_SIZE_CAP_HPP
