/**
 * @file TimeSeriesAssembler.cpp
 * @brief Alignement d'un ensemble de trajectoires sur un axe temporel commun.
 *
 * L'alignement est purement positionnel : l'échantillon i de chaque
 * trajectoire est placé sur la ligne du temps t_i.
 */

#include "data/TimeSeriesAssembler.hpp"

#include <string>

namespace randomwalk {

TimeSeriesTable TimeSeriesAssembler::assemble(const Ensemble& ensemble,
                                              double timeStep, double duration) {
    TimeGrid grid(timeStep, duration);
    return assemble(ensemble, grid);
}

TimeSeriesTable TimeSeriesAssembler::assemble(const Ensemble& ensemble, const TimeGrid& grid) {
    const std::size_t rows = grid.size();
    if (rows != ensemble.numSteps()) {
        throw DimensionMismatch(
            "Time axis has " + std::to_string(rows) + " points but walks have "
            + std::to_string(ensemble.numSteps()) + " samples");
    }

    const std::size_t walks = ensemble.count();
    Eigen::MatrixXd data(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(walks + 1));

    data.col(0) = Eigen::Map<const Eigen::VectorXd>(
        grid.getTimes().data(), static_cast<Eigen::Index>(rows));
    for (std::size_t j = 0; j < walks; ++j) {
        data.col(static_cast<Eigen::Index>(j + 1)) = Eigen::Map<const Eigen::VectorXd>(
            ensemble[j].samples().data(), static_cast<Eigen::Index>(rows));
    }

    return TimeSeriesTable(std::move(data), columnNames(walks));
}

std::vector<std::string> TimeSeriesAssembler::columnNames(std::size_t walkCount) {
    std::vector<std::string> names;
    names.reserve(walkCount + 1);
    names.emplace_back("x");
    for (std::size_t j = 1; j <= walkCount; ++j) {
        names.push_back("walk" + std::to_string(j));
    }
    return names;
}

} // namespace randomwalk
