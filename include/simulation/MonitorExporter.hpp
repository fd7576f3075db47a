#ifndef MONITOR_EXPORTER_HPP
#define MONITOR_EXPORTER_HPP

#include "simulation/Monitor.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace netepi {

/**
 * @brief One row of a long-format table: the count of `what` on `day`.
 */
struct CountRecord {
    std::string what;
    int day;
    int count;
};

/**
 * @class MonitorExporter
 * @brief Converts recorded per-day counts into tables for downstream analysis.
 */
class MonitorExporter {
public:
    MonitorExporter() = delete;

    /**
     * @brief Long-format rows (what, day, count) for susceptible, incubating and sick.
     *
     * Rows are grouped by `what` in that order, then by recording order.
     *
     * @throws InvalidResultException if the monitor's sequences differ in length.
     */
    static std::vector<CountRecord> toLongFormat(const Monitor& monitor);

    /**
     * @brief Counts as a matrix: one row per recorded day, columns
     *        day, susceptible, incubating, sick, recovered.
     *
     * @throws InvalidResultException if the monitor's sequences differ in length.
     */
    static Eigen::MatrixXi countsMatrix(const Monitor& monitor);

    /**
     * @brief Saves toLongFormat() as CSV with header `what,day,count`.
     *
     * @throws InvalidResultException if the monitor's sequences differ in length.
     * @throws FileIOException if the file cannot be opened.
     */
    static void saveLongFormatCSV(const Monitor& monitor, const std::string& filename);
};

} // namespace netepi

#endif // MONITOR_EXPORTER_HPP
