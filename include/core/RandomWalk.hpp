#pragma once
#include "Errors.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace randomwalk {

/**
 * @brief Trajectoire échantillonnée, immuable après construction.
 *
 * samples()[0] est la valeur initiale ; size() est le nombre de pas.
 */
class RandomWalk {
private:
    std::vector<double> samples_;

public:
    explicit RandomWalk(std::vector<double> samples) : samples_(std::move(samples)) {
        if (samples_.empty()) {
            throw InvalidParameter("A random walk holds at least its initial value");
        }
    }

    std::size_t size() const noexcept { return samples_.size(); }
    double initialValue() const { return samples_.front(); }

    double operator[](std::size_t i) const {
        if (i >= samples_.size()) {
            throw std::out_of_range("Sample index out of range");
        }
        return samples_[i];
    }

    const std::vector<double>& samples() const noexcept { return samples_; }

    bool operator==(const RandomWalk& other) const { return samples_ == other.samples_; }
    bool operator!=(const RandomWalk& other) const { return !(*this == other); }
};

/**
 * @brief Collection ordonnée de trajectoires de même longueur.
 */
class Ensemble {
private:
    std::vector<RandomWalk> walks_;

public:
    explicit Ensemble(std::vector<RandomWalk> walks) : walks_(std::move(walks)) {
        if (walks_.empty()) {
            throw InvalidParameter("An ensemble holds at least one walk");
        }
        const std::size_t n = walks_.front().size();
        for (std::size_t j = 1; j < walks_.size(); ++j) {
            if (walks_[j].size() != n) {
                throw DimensionMismatch(
                    "Walk " + std::to_string(j) + " has " + std::to_string(walks_[j].size())
                    + " samples, expected " + std::to_string(n));
            }
        }
    }

    std::size_t count() const noexcept { return walks_.size(); }
    std::size_t numSteps() const noexcept { return walks_.front().size(); }

    const RandomWalk& operator[](std::size_t j) const {
        if (j >= walks_.size()) {
            throw std::out_of_range("Walk index out of range");
        }
        return walks_[j];
    }

    const std::vector<RandomWalk>& walks() const noexcept { return walks_; }

    std::vector<RandomWalk>::const_iterator begin() const { return walks_.begin(); }
    std::vector<RandomWalk>::const_iterator end() const { return walks_.end(); }
};

} // namespace randomwalk
