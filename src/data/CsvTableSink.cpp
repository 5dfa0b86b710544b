#include "data/VisualizationSink.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace randomwalk {

void CsvTableSink::render(const TimeSeriesTable& table, const PlotOptions& options) {
    options.validate();

    std::ofstream file(filename_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open CSV output file: " + filename_);
    }

    const auto& names = table.columnNames();
    for (std::size_t j = 0; j < names.size(); ++j) {
        if (j > 0) file << ',';
        file << names[j];
    }
    file << '\n';

    file << std::setprecision(17);
    const auto& m = table.matrix();
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            if (j > 0) file << ',';
            file << m(i, j);
        }
        file << '\n';
    }

    if (!file) {
        throw std::runtime_error("Failed writing CSV output file: " + filename_);
    }
}

} // namespace randomwalk
