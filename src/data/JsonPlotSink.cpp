/**
 * @file JsonPlotSink.cpp
 * @brief Description JSON d'un graphique « points + lignes » des trajectoires.
 *
 * Le document produit suffit à un outil de tracé externe :
 *  - x : la colonne temps
 *  - series : une entrée par trajectoire, couleur indexée par la colonne
 *  - ylim : bornes transmises sans modification
 */

#include "data/VisualizationSink.hpp"
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace randomwalk {

void JsonPlotSink::render(const TimeSeriesTable& table, const PlotOptions& options) {
    options.validate();

    json plot;
    plot["xlabel"] = options.xLabel;
    plot["ylabel"] = options.yLabel;
    plot["ylim"] = {options.yMin, options.yMax};
    plot["x"] = table.timeColumn();

    json series = json::array();
    const auto& names = table.columnNames();
    for (std::size_t col = 1; col < table.columnCount(); ++col) {
        series.push_back({
            {"name", names[col]},
            {"column", col},
            {"color", col},
            {"type", "o"},
            {"y", table.column(col)}
        });
    }
    plot["series"] = std::move(series);

    std::ofstream file(filename_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open plot output file: " + filename_);
    }
    file << plot.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing plot output file: " + filename_);
    }
}

} // namespace randomwalk
