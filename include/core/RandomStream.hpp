// include/core/RandomStream.hpp
#ifndef RANDOM_STREAM_HPP
#define RANDOM_STREAM_HPP

#include <random>
#include <cstdint>

namespace randomwalk {

/**
 * @brief Flux pseudo-aléatoire explicite, possédé par l'appelant.
 *
 * Chaque tirage gaussien consomme le flux dans l'ordre des appels.
 * Deux flux construits avec la même graine (non nulle) et le même index
 * produisent exactement la même suite de tirages.
 *
 * Les 64 bits de la graine et de l'index passent par un std::seed_seq :
 * les graines 1 et 2^32 + 1 donnent des flux différents.
 *
 * Un RandomStream n'est pas thread-safe : pour générer en parallèle,
 * chaque tâche doit posséder son propre flux.
 */
class RandomStream {
private:
    std::mt19937 generator_;
    std::normal_distribution<double> stdNormal_;
    std::uint64_t seed_;
    std::uint64_t streamIndex_;
    std::uint64_t draws_;

    void reseed() {
        std::seed_seq seq{
            static_cast<std::uint32_t>(seed_), static_cast<std::uint32_t>(seed_ >> 32),
            static_cast<std::uint32_t>(streamIndex_), static_cast<std::uint32_t>(streamIndex_ >> 32)
        };
        generator_.seed(seq);
        stdNormal_.reset();
        draws_ = 0;
    }

public:
    // seed == 0 : graine tirée de std::random_device
    explicit RandomStream(std::uint64_t seed = 0)
        : stdNormal_(0.0, 1.0), seed_(0), streamIndex_(0), draws_(0) {
        setSeed(seed);
    }

    /**
     * @brief Sous-flux streamIndex d'une graine de base.
     *
     * La graine est prise telle quelle, 0 compris : ce constructeur est
     * toujours déterministe.
     */
    RandomStream(std::uint64_t seed, std::uint64_t streamIndex)
        : stdNormal_(0.0, 1.0), seed_(seed), streamIndex_(streamIndex), draws_(0) {
        reseed();
    }

    // Pas de copie implicite : deux copies rejoueraient les mêmes tirages
    RandomStream(const RandomStream&) = delete;
    RandomStream& operator=(const RandomStream&) = delete;
    RandomStream(RandomStream&&) = default;
    RandomStream& operator=(RandomStream&&) = default;

    void setSeed(std::uint64_t seed) {
        if (seed == 0) {
            std::random_device rd;
            seed_ = (static_cast<std::uint64_t>(rd()) << 32) | rd();
        } else {
            seed_ = seed;
        }
        reseed();
    }

    /**
     * @brief Tirage N(0, 1).
     */
    double generateGaussian() {
        ++draws_;
        return stdNormal_(generator_);
    }

    /**
     * @brief Tirage N(0, sd). sd == 0 consomme quand même un tirage.
     */
    double generateGaussian(double sd) {
        return sd * generateGaussian();
    }

    std::uint64_t getSeed() const { return seed_; }
    std::uint64_t getStreamIndex() const { return streamIndex_; }
    std::uint64_t getDrawCount() const { return draws_; }
};

} // namespace randomwalk

#endif // RANDOM_STREAM_HPP
