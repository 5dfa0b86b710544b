#pragma once
#include <string>
#include <vector>
#include <limits>
#include <cstdint>
#include <cstddef>

namespace randomwalk {

/**
 * @struct SimulationConfig
 * @brief Paramètres d'une simulation complète (génération + rendu).
 */
struct SimulationConfig {
    /** Taille demandée maximale : count + 1 doit rester représentable */
    static constexpr long long kMaxCount = std::numeric_limits<long long>::max() - 1;

    long long count = 1;            /**< Taille d'ensemble demandée */
    double initialValue = 70.0;     /**< Valeur initiale de chaque trajectoire */
    double duration = 1.0;          /**< Dernier instant de l'axe temporel */
    double sd = 1.0;                /**< Écart-type des incréments */
    double timeStep = 0.01;         /**< Pas de temps */
    double yMin = 45.0;             /**< Borne basse du graphique (rendu seulement) */
    double yMax = 100.0;            /**< Borne haute du graphique (rendu seulement) */
    std::uint64_t seed = 0;         /**< 0 : graine tirée de std::random_device */
    std::size_t threads = 1;        /**< > 1 : génération parallèle */
    bool legacyExtraWalk = true;    /**< Génère count + 1 trajectoires */
    std::string csvOutput;          /**< Export CSV de la table (vide : aucun) */
    std::string plotOutput;         /**< Description JSON du graphique (vide : aucune) */

    /**
     * @throws InvalidParameter si un champ sort de son domaine
     */
    void validate() const;

    /**
     * @brief Applique une surcharge "clé=valeur" (ligne de commande).
     * @throws std::invalid_argument si la clé est inconnue ou la valeur illisible
     */
    void applyOverride(const std::string& assignment);

    std::string toString() const;
};

/**
 * @brief Charge une configuration JSON ; les clés absentes gardent leur défaut.
 * @throws std::runtime_error si le fichier est illisible ou mal typé
 */
SimulationConfig loadConfig(const std::string& filename);

/**
 * @brief Construit la configuration depuis les arguments du programme.
 *
 * Au plus un argument sans '=' : le fichier JSON, chargé en premier.
 * Les arguments "clé=valeur" s'appliquent ensuite, dans leur ordre.
 *
 * @throws std::invalid_argument si deux fichiers sont donnés ou une surcharge est invalide
 * @throws std::runtime_error si le fichier est illisible ou mal typé
 */
SimulationConfig parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Variante à partir d'un texte JSON.
 */
SimulationConfig parseConfig(const std::string& text);

} // namespace randomwalk
