#pragma once
#include <stdexcept>
#include <string>

namespace randomwalk {

/**
 * @brief Paramètre hors domaine (nombre de pas, écart-type, taille d'ensemble,
 *        pas de temps, durée, bornes du graphique).
 */
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Longueurs incompatibles entre l'axe temporel et les trajectoires,
 *        ou entre trajectoires d'un même ensemble.
 */
class DimensionMismatch : public std::runtime_error {
public:
    explicit DimensionMismatch(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace randomwalk
