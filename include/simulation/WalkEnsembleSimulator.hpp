/**
 * @file WalkEnsembleSimulator.hpp
 * @brief Chaîne complète : génération de l'ensemble, alignement, rendu.
 */

#pragma once
#include "SimulationConfig.hpp"
#include "../core/TimeGrid.hpp"
#include "../data/TimeSeriesTable.hpp"
#include "../data/VisualizationSink.hpp"
#include <cstddef>
#include <cstdint>

namespace randomwalk {

/**
 * @struct SimulationResult
 * @brief Table assemblée et dimensions effectivement utilisées.
 */
struct SimulationResult {
    TimeSeriesTable table;
    long long requestedCount;   /**< Taille demandée par l'appelant */
    long long effectiveCount;   /**< Nombre de trajectoires générées */
    std::size_t numSteps;       /**< Échantillons par trajectoire */
    std::uint64_t seed;         /**< Graine effective du flux */
};

class WalkEnsembleSimulator {
public:
    /**
     * @brief Taille d'ensemble réellement générée.
     *
     * Avec legacyExtraWalk (défaut), une trajectoire de plus que demandé
     * est générée : count = 3 produit 4 séries dans la table.
     */
    static long long effectiveCount(const SimulationConfig& config);

    /**
     * @brief Génère, aligne et transmet la table au récepteur (optionnel).
     *
     * num_steps est dérivé une seule fois de (duration, timeStep) puis
     * utilisé pour la génération et pour l'alignement.
     *
     * @throws InvalidParameter si la configuration est invalide
     */
    static SimulationResult run(const SimulationConfig& config, VisualizationSink* sink = nullptr);
};

} // namespace randomwalk
