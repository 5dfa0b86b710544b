#include <catch2/catch.hpp>

#include "../include/data/VisualizationSink.hpp"
#include "../include/data/TimeSeriesAssembler.hpp"
#include "../include/simulation/EnsembleGenerator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace randomwalk;
using Catch::Detail::Approx;
using json = nlohmann::json;

namespace {

TimeSeriesTable makeTable() {
    RandomStream stream(11);
    auto ensemble = EnsembleGenerator::generate(3, 70.0, 5, 1.0, stream);
    return TimeSeriesAssembler::assemble(ensemble, 0.01, 0.04);
}

} // namespace

// Test 1 : export CSV
TEST_CASE("CSV sink writes a header and one line per time point", "[VisualizationSink]")
{
    const std::string filename = "test_table_export.csv";
    if (std::filesystem::exists(filename))
        std::filesystem::remove(filename);

    auto table = makeTable();
    CsvTableSink sink(filename);
    sink.render(table, PlotOptions{});

    REQUIRE(std::filesystem::exists(filename));

    std::ifstream file(filename);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    REQUIRE(line == "x,walk1,walk2,walk3");

    int lineCount = 0;
    while (std::getline(file, line))
        ++lineCount;
    REQUIRE(lineCount == 5);

    file.close();
    std::filesystem::remove(filename);
}

// Test 2 : description JSON du graphique
TEST_CASE("JSON sink describes axes, range and one series per walk", "[VisualizationSink]")
{
    const std::string filename = "test_plot_export.json";

    auto table = makeTable();
    PlotOptions options;
    options.yMin = 60.0;
    options.yMax = 80.0;

    JsonPlotSink sink(filename);
    sink.render(table, options);

    std::ifstream file(filename);
    REQUIRE(file.is_open());
    json plot = json::parse(file);
    file.close();
    std::filesystem::remove(filename);

    REQUIRE(plot["xlabel"] == "Time");
    REQUIRE(plot["ylabel"] == "Value");
    REQUIRE(plot["ylim"][0].get<double>() == Approx(60.0));
    REQUIRE(plot["ylim"][1].get<double>() == Approx(80.0));
    REQUIRE(plot["x"].size() == 5);
    REQUIRE(plot["series"].size() == 3);

    for (std::size_t k = 0; k < 3; ++k) {
        const auto& s = plot["series"][k];
        REQUIRE(s["column"].get<std::size_t>() == k + 1);
        REQUIRE(s["color"].get<std::size_t>() == k + 1);
        REQUIRE(s["name"] == "walk" + std::to_string(k + 1));
        REQUIRE(s["y"].get<std::vector<double>>() == table.column(k + 1));
    }
}

// Test 3 : bornes invalides
TEST_CASE("Sinks reject an empty plot range", "[VisualizationSink]")
{
    auto table = makeTable();
    PlotOptions options;
    options.yMin = 100.0;
    options.yMax = 100.0;

    JsonPlotSink sink("never_written.json");
    REQUIRE_THROWS_AS(sink.render(table, options), InvalidParameter);
    REQUIRE_FALSE(std::filesystem::exists("never_written.json"));
}

// Test 4 : fichier inaccessible
TEST_CASE("CSV sink reports unwritable output", "[VisualizationSink]")
{
    auto table = makeTable();
    CsvTableSink sink("missing_directory/table.csv");

    REQUIRE_THROWS_AS(sink.render(table, PlotOptions{}), std::runtime_error);
}
