#pragma once
#include "Errors.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <cmath>
#include <cstddef>

namespace randomwalk {

/**
 * @brief Axe temporel régulier d'une trajectoire échantillonnée
 *
 * Points 0, h, 2h, ... jusqu'à la durée incluse :
 *   t_i = i * h,  i = 0 .. L-1,  L = floor(duration / h + 1e-10) + 1
 *
 * La tolérance absorbe les erreurs d'arrondi binaire : 0.04 / 0.01 donne
 * bien 5 points.
 *
 * Exemple : TimeGrid(0.01, 1.0) → 101 points, dernier point 1.0
 */
class TimeGrid {
private:
    std::vector<double> times_;

    static constexpr double kTolerance = 1e-10;

public:
    /**
     * @param timeStep Pas de temps (> 0)
     * @param duration Dernier instant (>= 0)
     */
    TimeGrid(double timeStep, double duration) {
        std::size_t n = numPointsFor(timeStep, duration);
        times_.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            times_.push_back(static_cast<double>(i) * timeStep);
        }
    }

    std::size_t size() const { return times_.size(); }

    double operator[](std::size_t i) const {
        if (i >= times_.size()) {
            throw std::out_of_range("Time index out of range");
        }
        return times_[i];
    }

    const std::vector<double>& getTimes() const { return times_; }

    /**
     * @brief Nombre de points de l'axe (= nombre d'échantillons par trajectoire)
     *
     * C'est l'unique dérivation de num_steps à partir de (duration, timeStep).
     *
     * @throws InvalidParameter si timeStep <= 0, duration < 0, l'un des deux
     *         n'est pas fini, ou si l'axe dépasse la taille maximale d'un vecteur
     */
    static std::size_t numPointsFor(double timeStep, double duration) {
        if (!std::isfinite(timeStep) || timeStep <= 0.0) {
            throw InvalidParameter("Time step must be finite and > 0, got "
                                   + std::to_string(timeStep));
        }
        if (!std::isfinite(duration) || duration < 0.0) {
            throw InvalidParameter("Duration must be finite and >= 0, got "
                                   + std::to_string(duration));
        }
        double n = std::floor(duration / timeStep + kTolerance);
        // La conversion d'un double hors domaine vers size_t est indéfinie
        const double maxPoints = static_cast<double>(std::vector<double>().max_size());
        if (!(n < maxPoints - 1.0)) {
            throw InvalidParameter("Time axis too long: duration / time step = "
                                   + std::to_string(duration / timeStep));
        }
        return static_cast<std::size_t>(n) + 1;
    }
};

} // namespace randomwalk
