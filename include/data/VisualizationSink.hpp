#pragma once
#include "TimeSeriesTable.hpp"
#include <string>
#include <utility>

namespace randomwalk {

/**
 * @brief Options de rendu transmises telles quelles au récepteur.
 */
struct PlotOptions {
    double yMin = 45.0;
    double yMax = 100.0;
    std::string xLabel = "Time";
    std::string yLabel = "Value";

    void validate() const;
};

/**
 * @brief Récepteur de la table assemblée.
 *
 * Contrat de présentation : la colonne 0 est l'axe des abscisses, chaque
 * autre colonne est une série distincte (marqueur / couleur indexés par la
 * colonne), l'axe des ordonnées est borné à [yMin, yMax].
 */
class VisualizationSink {
public:
    virtual ~VisualizationSink() = default;
    virtual void render(const TimeSeriesTable& table, const PlotOptions& options) = 0;
};

/**
 * @brief Exporte la table au format CSV (en-tête x,walk1,...).
 */
class CsvTableSink : public VisualizationSink {
public:
    explicit CsvTableSink(std::string filename) : filename_(std::move(filename)) {}
    void render(const TimeSeriesTable& table, const PlotOptions& options) override;

private:
    std::string filename_;
};

/**
 * @brief Écrit une description JSON du graphique (axes, bornes, séries).
 */
class JsonPlotSink : public VisualizationSink {
public:
    explicit JsonPlotSink(std::string filename) : filename_(std::move(filename)) {}
    void render(const TimeSeriesTable& table, const PlotOptions& options) override;

private:
    std::string filename_;
};

} // namespace randomwalk
