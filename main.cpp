#include "simulation/SimulationConfig.hpp"
#include "simulation/WalkEnsembleSimulator.hpp"
#include "data/VisualizationSink.hpp"

#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <exception>
#include <algorithm>

using namespace randomwalk;

namespace {

// Distribue la table à plusieurs récepteurs
class SinkChain : public VisualizationSink {
public:
    void add(std::unique_ptr<VisualizationSink> sink) { sinks_.push_back(std::move(sink)); }
    bool empty() const { return sinks_.empty(); }

    void render(const TimeSeriesTable& table, const PlotOptions& options) override {
        for (auto& sink : sinks_) {
            sink->render(table, options);
        }
    }

private:
    std::vector<std::unique_ptr<VisualizationSink>> sinks_;
};

void printUsage(const char* prog) {
    std::cout << "Usage : " << prog << " [config.json] [key=value ...]\n"
              << "Clés : count, initial_value, duration, sd, time_step, y_min, y_max,\n"
              << "       seed, threads, legacy_extra_walk, csv, plot\n";
}

void printPreview(const TimeSeriesTable& table, std::size_t maxRows) {
    const auto& names = table.columnNames();
    for (const auto& name : names) {
        std::cout << std::setw(12) << name;
    }
    std::cout << "\n";

    std::size_t rows = std::min(maxRows, table.rowCount());
    for (std::size_t i = 0; i < rows; ++i) {
        for (std::size_t j = 0; j < table.columnCount(); ++j) {
            std::cout << std::setw(12) << std::fixed << std::setprecision(4) << table.at(i, j);
        }
        std::cout << "\n";
    }
    if (rows < table.rowCount()) {
        std::cout << "  ... (" << table.rowCount() - rows << " lignes de plus)\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║     ENSEMBLE DE MARCHES ALÉATOIRES GAUSSIENNES            ║
╚═══════════════════════════════════════════════════════════╝
)" << std::endl;

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        for (const auto& arg : args) {
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            }
        }
        SimulationConfig config = parseCommandLine(args);

        std::cout << config.toString() << "\n";

        SinkChain sinks;
        if (!config.csvOutput.empty())
            sinks.add(std::make_unique<CsvTableSink>(config.csvOutput));
        if (!config.plotOutput.empty())
            sinks.add(std::make_unique<JsonPlotSink>(config.plotOutput));

        auto start = std::chrono::high_resolution_clock::now();
        SimulationResult result = WalkEnsembleSimulator::run(config, sinks.empty() ? nullptr : &sinks);
        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << "Trajectoires demandées : " << result.requestedCount << "\n";
        std::cout << "Trajectoires générées  : " << result.effectiveCount << "\n";
        std::cout << "Pas par trajectoire    : " << result.numSteps << "\n";
        std::cout << "Graine                 : " << result.seed << "\n\n";

        printPreview(result.table, 5);

        if (!config.csvOutput.empty())
            std::cout << "\nTable exportée dans " << config.csvOutput << "\n";
        if (!config.plotOutput.empty())
            std::cout << "Graphique décrit dans " << config.plotOutput << "\n";

        std::cout << "\nSimulation terminée en " << elapsed.count() << " ms.\n";
    } catch (const std::exception& e) {
        std::cerr << "Erreur : " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
