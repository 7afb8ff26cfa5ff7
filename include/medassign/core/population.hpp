#pragma once

/// @file population.hpp
/// @brief Population with Structure-of-Arrays layout and a per-individual fitness cache
///
/// Genomes and cached fitness values live in separate PMR containers. A cached fitness is
/// dropped whenever the genome is handed out for modification, so evaluation only has to
/// revisit individuals whose genes actually changed.

#include <memory_resource>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <medassign/core/concepts.hpp>

namespace medassign::core {

/// Population of candidates with cached, invalidatable fitness
///
/// @tparam GenomeT The genome type (std::vector<int> for assignment candidates)
template <typename GenomeT>
class Population {
  private:
    std::pmr::vector<GenomeT> genomes_;
    std::pmr::vector<std::optional<Fitness>> fitness_;

  public:
    /// Construct population with specified capacity and optional custom memory resource
    ///
    /// @param capacity Number of individuals to reserve room for
    /// @param resource Custom memory resource for allocation (default: global default)
    explicit Population(std::size_t capacity,
                        std::pmr::memory_resource* resource = std::pmr::get_default_resource())
        : genomes_(std::pmr::polymorphic_allocator<GenomeT>(resource)),
          fitness_(std::pmr::polymorphic_allocator<std::optional<Fitness>>(resource)) {
        genomes_.reserve(capacity);
        fitness_.reserve(capacity);
    }

    /// Get the reserved capacity (minimum of both containers)
    [[nodiscard]] std::size_t capacity() const noexcept {
        const auto gcap = genomes_.capacity();
        const auto fcap = fitness_.capacity();
        return gcap < fcap ? gcap : fcap;
    }

    [[nodiscard]] std::size_t size() const noexcept { return genomes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return genomes_.empty(); }

    void reserve(std::size_t new_cap) {
        genomes_.reserve(new_cap);
        fitness_.reserve(new_cap);
    }

    /// Add an individual, optionally with an already known fitness
    ///
    /// @throws std::exception Strong exception safety guarantee
    void push_back(const GenomeT& genome, std::optional<Fitness> fitness = std::nullopt) {
        genomes_.push_back(genome);
        try {
            fitness_.push_back(fitness);
        } catch (...) {
            genomes_.pop_back(); // Restore invariant if fitness insertion fails
            throw;
        }
    }

    /// Add an individual (move version)
    ///
    /// @throws std::exception Strong exception safety guarantee
    void push_back(GenomeT&& genome, std::optional<Fitness> fitness = std::nullopt) {
        genomes_.push_back(std::move(genome));
        try {
            fitness_.push_back(fitness);
        } catch (...) {
            genomes_.pop_back();
            throw;
        }
    }

    /// Read-only access to a genome
    [[nodiscard]] const GenomeT& genome(std::size_t index) const noexcept {
        return genomes_[index];
    }

    /// Writable access to a genome; drops the cached fitness of that individual
    [[nodiscard]] GenomeT& modify(std::size_t index) noexcept {
        fitness_[index].reset();
        return genomes_[index];
    }

    /// Writable access that keeps the cache; the caller must call invalidate() if it
    /// changes any gene
    [[nodiscard]] GenomeT& mutable_genome(std::size_t index) noexcept {
        return genomes_[index];
    }

    /// Whether the individual carries a valid cached fitness
    [[nodiscard]] bool has_fitness(std::size_t index) const noexcept {
        return fitness_[index].has_value();
    }

    /// Cached fitness of an individual
    ///
    /// @throws std::logic_error if the individual has not been evaluated
    [[nodiscard]] Fitness fitness(std::size_t index) const {
        if (!fitness_[index]) {
            throw std::logic_error("Fitness requested for an unevaluated individual");
        }
        return *fitness_[index];
    }

    void set_fitness(std::size_t index, Fitness fitness) noexcept { fitness_[index] = fitness; }

    void invalidate(std::size_t index) noexcept { fitness_[index].reset(); }

    /// Number of individuals lacking a cached fitness
    [[nodiscard]] std::size_t invalid_count() const noexcept {
        std::size_t count = 0;
        for (const auto& f : fitness_) {
            if (!f)
                ++count;
        }
        return count;
    }

    /// Span over all genomes
    [[nodiscard]] std::span<const GenomeT> genomes() const {
        return {genomes_.data(), genomes_.size()};
    }

    /// Cached fitness values of a fully evaluated population
    ///
    /// @throws std::logic_error if any individual is unevaluated
    [[nodiscard]] std::vector<Fitness> fitness_values() const {
        std::vector<Fitness> values;
        values.reserve(fitness_.size());
        for (std::size_t i = 0; i < fitness_.size(); ++i) {
            values.push_back(fitness(i));
        }
        return values;
    }

    void clear() noexcept {
        genomes_.clear();
        fitness_.clear();
    }

    [[nodiscard]] std::pmr::memory_resource* get_memory_resource() const noexcept {
        return genomes_.get_allocator().resource();
    }
};

} // namespace medassign::core
