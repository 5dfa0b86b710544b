#pragma once
#include "../core/RandomWalk.hpp"
#include "../core/TimeGrid.hpp"
#include "TimeSeriesTable.hpp"

namespace randomwalk {

class TimeSeriesAssembler {
public:
    /**
     * @brief Construit l'axe temporel 0, h, ..., duration et y aligne l'ensemble.
     *
     * @throws InvalidParameter si timeStep <= 0 ou duration < 0
     * @throws DimensionMismatch si la longueur de l'axe diffère de numSteps
     */
    static TimeSeriesTable assemble(const Ensemble& ensemble, double timeStep, double duration);

    /**
     * @brief Variante pour un axe déjà construit (num_steps dérivé de la grille).
     */
    static TimeSeriesTable assemble(const Ensemble& ensemble, const TimeGrid& grid);

    static std::vector<std::string> columnNames(std::size_t walkCount);
};

} // namespace randomwalk
