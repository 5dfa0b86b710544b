/**
 * @file EnsembleGenerator.hpp
 * @brief Génération d'un ensemble de marches aléatoires gaussiennes indépendantes.
 * @version 1.0
 */

#pragma once
#include "../core/RandomStream.hpp"
#include "../core/RandomWalk.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace randomwalk {

/**
 * @class EnsembleGenerator
 * @brief Répète le générateur de trajectoire count fois, en séquentiel sur un
 *        flux partagé ou en parallèle avec un flux par trajectoire.
 */
class EnsembleGenerator {
public:

    /**
     * @struct EnsembleStatistics
     * @brief Statistiques par pas de temps, limitées à ce qu'il faut pour
     *        vérifier la loi de variance brownienne.
     */
    struct EnsembleStatistics {
        std::vector<double> meanPath;        /**< Moyenne empirique de X_i */
        std::vector<double> incrementVariance; /**< Variance empirique de X_i - X_0 */
        std::size_t nWalks{};                /**< Nombre de trajectoires */
    };

    /**
     * @brief Génère count trajectoires en consommant un flux partagé.
     *
     * Les tirages des trajectoires se suivent dans l'ordre du flux :
     * la trajectoire j n'est reproductible qu'avec le même flux et les
     * mêmes appels précédents.
     *
     * @throws InvalidParameter si count < 1, numSteps < 1 ou sd < 0
     */
    static Ensemble generate(long long count, double initialValue,
                             long long numSteps, double sd,
                             RandomStream& stream);

    /**
     * @brief Génère count trajectoires en parallèle.
     *
     * La trajectoire j utilise son propre sous-flux RandomStream(seed, j) :
     * le résultat est identique quel que soit nThreads, pour toute graine
     * non nulle, UINT64_MAX compris.
     *
     * @param seed Graine de base (0 : tirée de std::random_device)
     * @param nThreads Nombre de threads (0 : hardware_concurrency)
     */
    static Ensemble generateParallel(long long count, double initialValue,
                                     long long numSteps, double sd,
                                     std::uint64_t seed, std::size_t nThreads = 0);

    /**
     * @brief Calcule les statistiques par pas de temps.
     * @throws InvalidParameter si l'ensemble contient moins de 2 trajectoires
     */
    static EnsembleStatistics computeStatistics(const Ensemble& ensemble);

private:

    static void validate(long long count, long long numSteps, double sd);

    /**
     * @brief Simule les trajectoires [first, last) d'un lot (appelé par les threads).
     */
    static std::vector<RandomWalk> simulateBlock(std::size_t first, std::size_t last,
                                                 double initialValue, long long numSteps,
                                                 double sd, std::uint64_t seed);
};

} // namespace randomwalk
