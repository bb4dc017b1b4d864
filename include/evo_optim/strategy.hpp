#ifndef EVO_OPTIM__STRATEGY_HPP_
#define EVO_OPTIM__STRATEGY_HPP_

#include <random>
#include <string>
#include <vector>

#include "evo_optim/individual.hpp"

namespace evo_optim {

enum class BaseVector {
    RAND,
    BEST,
    RAND_TO_BEST
};

enum class CrossoverScheme {
    EXPONENTIAL,
    BINOMIAL
};

// How binomial crossover picks the genes it overwrites.
//   FIXED_DIMENSION: one random dimension n receives every successful draw, so
//                    exactly one gene changes (rules that read the trial
//                    vector compound on it).
//   ROTATING:        n advances after every draw, so each gene gets its own
//                    draw and the last one is always taken.
enum class BinomialTargeting {
    FIXED_DIMENSION,
    ROTATING
};

// "DE/<base>/<count>/<crossover>", e.g. "DE/rand-to-best/1/exp".
struct StrategyDescriptor {
    BaseVector base = BaseVector::RAND;
    int difference_count = 1;
    CrossoverScheme crossover = CrossoverScheme::BINOMIAL;

    static StrategyDescriptor parse(const std::string& name);
    std::string to_string() const;

    bool operator==(const StrategyDescriptor& other) const {
        return base == other.base && difference_count == other.difference_count && crossover == other.crossover;
    }
};

// Every strategy identifier understood by StrategyDescriptor::parse.
const std::vector<std::string>& known_strategies();

// Draws k distinct indices from [0, n) that are not in `forbidden`, by a
// partial Fisher-Yates shuffle of the allowed pool. Throws ConfigurationError
// when fewer than k indices are allowed.
std::vector<size_t> sample_distinct_indices(size_t n, size_t k, const std::vector<size_t>& forbidden,
                                            std::mt19937& rng);

// Out-of-range genes of a DE mutant are redrawn inside this interval.
constexpr double kRepairLower = 0.0;
constexpr double kRepairUpper = 1.0;

// Number of donor indices drawn per target, whatever the strategy consumes.
constexpr size_t kDonorCount = 5;

// Vectors a mutation rule reads for one target. `trial` aliases the trial
// vector under construction, so rand-to-best sees genes already rewritten.
struct MutationInputs {
    const Candidate& trial;
    const Candidate& best;
    const Candidate* r[kDonorCount];
    double F;
};

// Mutated value of gene n.
using MutationRule = double (*)(const MutationInputs& in, size_t n);

// Builds DE trial vectors: mutation from the descriptor's base vector and
// difference terms, then exponential or binomial crossover against the
// target, then the unit-interval repair.
class StrategyEngine {
public:
    StrategyEngine(StrategyDescriptor descriptor, double F, double CR,
                   BinomialTargeting targeting = BinomialTargeting::FIXED_DIMENSION);

    // One trial candidate per population slot, slots visited in ascending order.
    std::vector<Candidate> offspring(const Population& population, const Candidate& best,
                                     std::mt19937& rng) const;

    // Trial vector for a single target slot given its donors r1..r5.
    Candidate trial(const Population& population, size_t target, const std::vector<size_t>& donors,
                    const Candidate& best, std::mt19937& rng) const;

    const StrategyDescriptor& descriptor() const { return descriptor_; }

private:
    void exponential(Candidate& trial, const MutationInputs& in, std::mt19937& rng) const;
    void binomial(Candidate& trial, const MutationInputs& in, std::mt19937& rng) const;
    static void repair(Candidate& trial, std::mt19937& rng);

    StrategyDescriptor descriptor_;
    double F_;
    double CR_;
    BinomialTargeting targeting_;
    MutationRule rule_;
};

}  // namespace evo_optim

#endif
