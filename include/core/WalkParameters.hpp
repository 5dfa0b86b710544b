#pragma once

#include "Errors.hpp"
#include <string>
#include <cmath>

namespace randomwalk {

/**
 * @brief Paramètres d'une marche aléatoire gaussienne additive
 * X_0 = x0, X_i = X_{i-1} + ε_i, ε_i ~ N(0, σ²)
 */
struct WalkParameters {
    double initialValue = 0.0;  // Valeur initiale, quelconque
    double sd = 1.0;            // Écart-type des incréments, fini et >= 0

    /**
     * @throws InvalidParameter si sd est négatif, infini ou NaN
     */
    void validate() const {
        if (std::isnan(sd) || std::isinf(sd) || sd < 0.0) {
            throw InvalidParameter("Standard deviation must be finite and >= 0, got "
                                   + std::to_string(sd));
        }
    }
};

/**
 * @brief Vérifie le nombre de pas d'une trajectoire (au moins l'état initial)
 */
inline void validateNumSteps(long long numSteps) {
    if (numSteps < 1) {
        throw InvalidParameter("Number of steps must be >= 1, got "
                               + std::to_string(numSteps));
    }
}

} // namespace randomwalk
