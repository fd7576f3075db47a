#include "simulation/MonitorExporter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <utility>

namespace netepi {

namespace {

void checkMonitor(const Monitor& monitor, const std::string& function) {
    if (!monitor.isValid()) {
        throw InvalidResultException(function, "Monitor sequences have inconsistent lengths.");
    }
}

} // namespace

std::vector<CountRecord> MonitorExporter::toLongFormat(const Monitor& monitor) {
    checkMonitor(monitor, "MonitorExporter::toLongFormat");

    const std::vector<std::pair<std::string, const std::vector<int>*>> columns = {
        {"susceptible", &monitor.susceptible},
        {"incubating", &monitor.incubating},
        {"sick", &monitor.sick},
    };

    std::vector<CountRecord> rows;
    rows.reserve(columns.size() * monitor.size());
    for (const auto& column : columns) {
        for (std::size_t i = 0; i < monitor.size(); ++i) {
            rows.push_back({column.first, monitor.day[i], (*column.second)[i]});
        }
    }
    return rows;
}

Eigen::MatrixXi MonitorExporter::countsMatrix(const Monitor& monitor) {
    checkMonitor(monitor, "MonitorExporter::countsMatrix");

    const Eigen::Index rows = static_cast<Eigen::Index>(monitor.size());
    Eigen::MatrixXi counts(rows, 5);
    for (Eigen::Index i = 0; i < rows; ++i) {
        counts(i, 0) = monitor.day[i];
        counts(i, 1) = monitor.susceptible[i];
        counts(i, 2) = monitor.incubating[i];
        counts(i, 3) = monitor.sick[i];
        counts(i, 4) = monitor.recovered[i];
    }
    return counts;
}

void MonitorExporter::saveLongFormatCSV(const Monitor& monitor, const std::string& filename) {
    const std::vector<CountRecord> rows = toLongFormat(monitor);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw FileIOException("MonitorExporter::saveLongFormatCSV", "Could not open file for writing: " + filename);
    }
    file << "what,day,count\n";
    for (const auto& row : rows) {
        file << row.what << "," << row.day << "," << row.count << "\n";
    }
    Logger::getInstance().info("MonitorExporter::saveLongFormatCSV",
                               "Wrote " + std::to_string(rows.size()) + " rows to " + filename);
}

} // namespace netepi
