#include "simulation/WalkEnsembleSimulator.hpp"
#include "simulation/EnsembleGenerator.hpp"
#include "data/TimeSeriesAssembler.hpp"
#include "core/RandomStream.hpp"
#include "core/Errors.hpp"

#include <string>
#include <utility>

namespace randomwalk {

long long WalkEnsembleSimulator::effectiveCount(const SimulationConfig& config) {
    if (config.legacyExtraWalk && config.count > SimulationConfig::kMaxCount) {
        throw InvalidParameter("count must be <= " + std::to_string(SimulationConfig::kMaxCount)
                               + " when the extra walk is enabled");
    }
    return config.legacyExtraWalk ? config.count + 1 : config.count;
}

SimulationResult WalkEnsembleSimulator::run(const SimulationConfig& config, VisualizationSink* sink) {
    config.validate();

    TimeGrid grid(config.timeStep, config.duration);
    const long long numSteps = static_cast<long long>(grid.size());
    const long long nWalks = effectiveCount(config);

    RandomStream stream(config.seed);
    const std::uint64_t seed = stream.getSeed();

    Ensemble ensemble = config.threads > 1
        ? EnsembleGenerator::generateParallel(nWalks, config.initialValue, numSteps,
                                              config.sd, seed, config.threads)
        : EnsembleGenerator::generate(nWalks, config.initialValue, numSteps,
                                      config.sd, stream);

    TimeSeriesTable table = TimeSeriesAssembler::assemble(ensemble, grid);

    if (sink) {
        PlotOptions options;
        options.yMin = config.yMin;
        options.yMax = config.yMax;
        sink->render(table, options);
    }

    return SimulationResult{std::move(table), config.count, nWalks,
                            static_cast<std::size_t>(numSteps), seed};
}

} // namespace randomwalk
