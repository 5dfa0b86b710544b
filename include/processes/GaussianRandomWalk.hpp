#pragma once
#include "core/WalkParameters.hpp"
#include "core/RandomStream.hpp"
#include "core/RandomWalk.hpp"
#include <vector>
#include <cstddef>
#include <utility>

namespace randomwalk {

/**
 * @brief Marche aléatoire gaussienne additive
 *
 *   X_0 = x0
 *   X_i = X_{i-1} + ε_i,   ε_i ~ N(0, σ²) indépendants
 *
 * σ doit être fini : σ = ±inf ou NaN est refusé comme paramètre invalide.
 * En revanche, aucune protection contre l'overflow ou les NaN produits en
 * cours de trajectoire par un σ fini mais extrême ou un très grand nombre
 * de pas.
 */
class GaussianRandomWalk {
private:
    WalkParameters params_;

public:
    explicit GaussianRandomWalk(double initialValue = 0.0, double sd = 1.0)
        : GaussianRandomWalk(WalkParameters{initialValue, sd}) {}

    explicit GaussianRandomWalk(const WalkParameters& params)
        : params_(params) {
        params_.validate();
    }

    /**
     * @brief Incrément suivant ε ~ N(0, σ²)
     */
    double nextIncrement(RandomStream& stream) const {
        return stream.generateGaussian(params_.sd);
    }

    /**
     * @brief Simule une trajectoire de numSteps échantillons.
     *
     * Consomme exactement numSteps - 1 tirages du flux.
     */
    RandomWalk simulatePath(long long numSteps, RandomStream& stream) const {
        validateNumSteps(numSteps);

        std::vector<double> path;
        path.reserve(static_cast<std::size_t>(numSteps));
        double state = params_.initialValue;
        path.push_back(state);

        for (long long i = 1; i < numSteps; ++i) {
            state += nextIncrement(stream);
            path.push_back(state);
        }
        return RandomWalk(std::move(path));
    }

    /**
     * @brief Génère une trajectoire.
     *
     * @param sd Écart-type des incréments : fini et >= 0
     * @throws InvalidParameter si numSteps < 1, sd < 0, sd infini ou NaN
     *         (levée avant tout tirage)
     */
    static RandomWalk generate(double initialValue, long long numSteps, double sd,
                               RandomStream& stream) {
        validateNumSteps(numSteps);
        GaussianRandomWalk walk(initialValue, sd);
        return walk.simulatePath(numSteps, stream);
    }

    // E[X_i] = x0
    double theoreticalMean(std::size_t i) const {
        (void)i;
        return params_.initialValue;
    }

    // Var(X_i - X_0) = i σ²
    double theoreticalVariance(std::size_t i) const {
        return static_cast<double>(i) * params_.sd * params_.sd;
    }
};

} // namespace randomwalk
