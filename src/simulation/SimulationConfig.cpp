/**
 * @file SimulationConfig.cpp
 * @brief Lecture et validation de la configuration de simulation.
 *
 * Format JSON, par exemple :
 *   { "count": 10, "initial_value": 70, "duration": 1.0, "sd": 1.0,
 *     "time_step": 0.01, "y_min": 45, "y_max": 100, "seed": 42 }
 */

#include "simulation/SimulationConfig.hpp"
#include "core/Errors.hpp"
#include "core/TimeGrid.hpp"
#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace randomwalk {

// ============================================================================
// FONCTIONS INTERNES
// ============================================================================

namespace {

template <typename T>
void readField(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(
            std::string("Invalid value for '") + key + "': " + e.what());
    }
}

// Conversion stricte : toute la chaîne doit être consommée
template <typename T>
T parseNumber(const std::string& key, const std::string& value) {
    std::istringstream iss(value);
    T result{};
    if (value.empty() || (value[0] == '-' && std::is_unsigned<T>::value)
        || !(iss >> result) || !iss.eof()) {
        throw std::invalid_argument("Invalid value for '" + key + "': " + value);
    }
    return result;
}

bool parseBool(const std::string& value) {
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    throw std::invalid_argument("Expected a boolean, got '" + value + "'");
}

} // namespace

// ============================================================================
// VALIDATION
// ============================================================================

void SimulationConfig::validate() const {
    if (count < 1)
        throw InvalidParameter("count must be >= 1, got " + std::to_string(count));
    // Laisse la place à la trajectoire supplémentaire historique
    if (count > kMaxCount)
        throw InvalidParameter("count must be <= " + std::to_string(kMaxCount)
                               + ", got " + std::to_string(count));
    if (!std::isfinite(sd) || sd < 0.0)
        throw InvalidParameter("sd must be finite and >= 0, got " + std::to_string(sd));
    if (!std::isfinite(initialValue))
        throw InvalidParameter("initial_value must be finite");
    // time_step > 0, duration >= 0
    TimeGrid::numPointsFor(timeStep, duration);
    if (!std::isfinite(yMin) || !std::isfinite(yMax) || yMin >= yMax)
        throw InvalidParameter("y_min must be < y_max");
}

// ============================================================================
// SURCHARGES EN LIGNE DE COMMANDE
// ============================================================================

void SimulationConfig::applyOverride(const std::string& assignment) {
    auto pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0)
        throw std::invalid_argument("Expected key=value, got '" + assignment + "'");

    const std::string key = assignment.substr(0, pos);
    const std::string value = assignment.substr(pos + 1);

    if (key == "count") count = parseNumber<long long>(key, value);
    else if (key == "initial_value") initialValue = parseNumber<double>(key, value);
    else if (key == "duration") duration = parseNumber<double>(key, value);
    else if (key == "sd") sd = parseNumber<double>(key, value);
    else if (key == "time_step") timeStep = parseNumber<double>(key, value);
    else if (key == "y_min") yMin = parseNumber<double>(key, value);
    else if (key == "y_max") yMax = parseNumber<double>(key, value);
    else if (key == "seed") seed = parseNumber<std::uint64_t>(key, value);
    else if (key == "threads") threads = parseNumber<std::size_t>(key, value);
    else if (key == "legacy_extra_walk") legacyExtraWalk = parseBool(value);
    else if (key == "csv") csvOutput = value;
    else if (key == "plot") plotOutput = value;
    else throw std::invalid_argument("Unknown option '" + key + "'");
}

std::string SimulationConfig::toString() const {
    std::ostringstream oss;
    oss << "SimulationConfig:\n"
        << "  count = " << count << "\n"
        << "  initial_value = " << initialValue << "\n"
        << "  duration = " << duration << "\n"
        << "  sd = " << sd << "\n"
        << "  time_step = " << timeStep << "\n"
        << "  y range = [" << yMin << ", " << yMax << "]\n"
        << "  seed = " << seed << "\n"
        << "  threads = " << threads << "\n"
        << "  legacy_extra_walk = " << (legacyExtraWalk ? "yes" : "no") << "\n";
    return oss.str();
}

// ============================================================================
// LECTURE JSON
// ============================================================================

SimulationConfig parseConfig(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed configuration: ") + e.what());
    }
    if (!j.is_object())
        throw std::runtime_error("Configuration must be a JSON object");

    SimulationConfig cfg;
    readField(j, "count", cfg.count);
    readField(j, "initial_value", cfg.initialValue);
    readField(j, "duration", cfg.duration);
    readField(j, "sd", cfg.sd);
    readField(j, "time_step", cfg.timeStep);
    readField(j, "y_min", cfg.yMin);
    readField(j, "y_max", cfg.yMax);
    readField(j, "seed", cfg.seed);
    readField(j, "threads", cfg.threads);
    readField(j, "legacy_extra_walk", cfg.legacyExtraWalk);
    readField(j, "csv", cfg.csvOutput);
    readField(j, "plot", cfg.plotOutput);
    return cfg;
}

// ============================================================================
// LIGNE DE COMMANDE
// ============================================================================

SimulationConfig parseCommandLine(const std::vector<std::string>& args) {
    std::string configFile;
    std::vector<std::string> overrides;
    for (const auto& arg : args) {
        if (arg.find('=') != std::string::npos) {
            overrides.push_back(arg);
        } else if (configFile.empty()) {
            configFile = arg;
        } else {
            throw std::invalid_argument("Only one configuration file allowed, got '"
                                        + configFile + "' and '" + arg + "'");
        }
    }

    // Le fichier d'abord, les surcharges ensuite, quel que soit l'ordre donné
    SimulationConfig cfg = configFile.empty() ? SimulationConfig{} : loadConfig(configFile);
    for (const auto& assignment : overrides) {
        cfg.applyOverride(assignment);
    }
    return cfg;
}

SimulationConfig loadConfig(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Cannot open configuration file: " + filename);

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str());
}

} // namespace randomwalk
