#include "simulation/EnsembleGenerator.hpp"
#include "processes/GaussianRandomWalk.hpp"
#include "core/Errors.hpp"

#include <eigen3/Eigen/Dense>

#include <algorithm>
#include <future>
#include <iterator>
#include <string>
#include <thread>

namespace randomwalk {

// ============================================================================
// VALIDATION
// ============================================================================

void EnsembleGenerator::validate(long long count, long long numSteps, double sd) {
    if (count < 1) {
        throw InvalidParameter("Ensemble size must be >= 1, got " + std::to_string(count));
    }
    validateNumSteps(numSteps);
    WalkParameters{0.0, sd}.validate();
}

// ============================================================================
// GÉNÉRATION SÉQUENTIELLE
// ============================================================================

Ensemble EnsembleGenerator::generate(long long count, double initialValue,
                                     long long numSteps, double sd,
                                     RandomStream& stream) {
    validate(count, numSteps, sd);

    GaussianRandomWalk process(initialValue, sd);
    std::vector<RandomWalk> walks;
    walks.reserve(static_cast<std::size_t>(count));
    for (long long j = 0; j < count; ++j) {
        walks.push_back(process.simulatePath(numSteps, stream));
    }
    return Ensemble(std::move(walks));
}

// ============================================================================
// GÉNÉRATION PARALLÈLE
// ============================================================================

std::vector<RandomWalk> EnsembleGenerator::simulateBlock(std::size_t first, std::size_t last,
                                                         double initialValue, long long numSteps,
                                                         double sd, std::uint64_t seed) {
    GaussianRandomWalk process(initialValue, sd);
    std::vector<RandomWalk> block;
    block.reserve(last - first);
    for (std::size_t j = first; j < last; ++j) {
        RandomStream stream(seed, j);
        block.push_back(process.simulatePath(numSteps, stream));
    }
    return block;
}

Ensemble EnsembleGenerator::generateParallel(long long count, double initialValue,
                                             long long numSteps, double sd,
                                             std::uint64_t seed, std::size_t nThreads) {
    validate(count, numSteps, sd);

    if (seed == 0) {
        seed = RandomStream(0).getSeed();
    }
    if (nThreads == 0) {
        nThreads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }

    const std::size_t nWalks = static_cast<std::size_t>(count);
    nThreads = std::min(nThreads, nWalks);
    const std::size_t blockSize = (nWalks + nThreads - 1) / nThreads;

    std::vector<std::future<std::vector<RandomWalk>>> futures;
    futures.reserve(nThreads);
    for (std::size_t first = 0; first < nWalks; first += blockSize) {
        std::size_t last = std::min(first + blockSize, nWalks);
        futures.push_back(std::async(std::launch::async, &EnsembleGenerator::simulateBlock,
                                     first, last, initialValue, numSteps, sd, seed));
    }

    // Les lots sont récupérés dans l'ordre : la trajectoire j reste en position j
    std::vector<RandomWalk> walks;
    walks.reserve(nWalks);
    for (auto& f : futures) {
        auto block = f.get();
        std::move(block.begin(), block.end(), std::back_inserter(walks));
    }
    return Ensemble(std::move(walks));
}

// ============================================================================
// STATISTIQUES
// ============================================================================

EnsembleGenerator::EnsembleStatistics
EnsembleGenerator::computeStatistics(const Ensemble& ensemble) {
    const std::size_t n = ensemble.count();
    if (n < 2) {
        throw InvalidParameter("Statistics need at least 2 walks, got " + std::to_string(n));
    }
    const std::size_t steps = ensemble.numSteps();

    // Une colonne par trajectoire
    Eigen::MatrixXd paths(steps, n);
    for (std::size_t j = 0; j < n; ++j) {
        paths.col(j) = Eigen::Map<const Eigen::VectorXd>(
            ensemble[j].samples().data(), static_cast<Eigen::Index>(steps));
    }

    Eigen::VectorXd mean = paths.rowwise().mean();

    // X_i - X_0 pour chaque trajectoire
    Eigen::RowVectorXd origin = paths.row(0);
    Eigen::MatrixXd displacement = paths.rowwise() - origin;
    Eigen::VectorXd dispMean = displacement.rowwise().mean();
    Eigen::MatrixXd centered = displacement.colwise() - dispMean;
    Eigen::VectorXd variance =
        (centered.array().square().rowwise().sum() / static_cast<double>(n - 1)).matrix();

    EnsembleStatistics stats;
    stats.nWalks = n;
    stats.meanPath.assign(mean.data(), mean.data() + mean.size());
    stats.incrementVariance.assign(variance.data(), variance.data() + variance.size());
    return stats;
}

} // namespace randomwalk
