#include "evo_optim/strategy.hpp"
#include "evo_optim/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace evo_optim {

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep)) parts.push_back(part);
    return parts;
}

// r[0]..r[4] are the donors r1..r5
double best_1(const MutationInputs& in, size_t n) {
    return in.best[n] + in.F * ((*in.r[1])[n] - (*in.r[2])[n]);
}

double rand_1(const MutationInputs& in, size_t n) {
    return (*in.r[0])[n] + in.F * ((*in.r[1])[n] - (*in.r[2])[n]);
}

double rand_to_best_1(const MutationInputs& in, size_t n) {
    return in.trial[n] + in.F * (in.best[n] - in.trial[n]) + in.F * ((*in.r[0])[n] - (*in.r[1])[n]);
}

double best_2(const MutationInputs& in, size_t n) {
    return in.best[n] + ((*in.r[0])[n] + (*in.r[1])[n] - (*in.r[2])[n] - (*in.r[3])[n]) * in.F;
}

double rand_2(const MutationInputs& in, size_t n) {
    return (*in.r[4])[n] + ((*in.r[0])[n] + (*in.r[1])[n] - (*in.r[2])[n] - (*in.r[3])[n]) * in.F;
}

struct RuleEntry {
    BaseVector base;
    int difference_count;
    MutationRule rule;
};

constexpr RuleEntry kRules[] = {
    {BaseVector::BEST, 1, best_1},
    {BaseVector::RAND, 1, rand_1},
    {BaseVector::RAND_TO_BEST, 1, rand_to_best_1},
    {BaseVector::BEST, 2, best_2},
    {BaseVector::RAND, 2, rand_2},
};

const RuleEntry* find_rule(BaseVector base, int difference_count) {
    for (const auto& entry : kRules) {
        if (entry.base == base && entry.difference_count == difference_count) return &entry;
    }
    return nullptr;
}

const char* base_name(BaseVector base) {
    switch (base) {
        case BaseVector::BEST: return "best";
        case BaseVector::RAND_TO_BEST: return "rand-to-best";
        case BaseVector::RAND: break;
    }
    return "rand";
}

}  // namespace

StrategyDescriptor StrategyDescriptor::parse(const std::string& name) {
    const auto parts = split(name, '/');
    if (parts.size() != 4 || parts[0] != "DE") {
        throw ConfigurationError("unknown DE strategy '" + name + "'");
    }

    StrategyDescriptor d;
    if (parts[1] == "best") d.base = BaseVector::BEST;
    else if (parts[1] == "rand") d.base = BaseVector::RAND;
    else if (parts[1] == "rand-to-best") d.base = BaseVector::RAND_TO_BEST;
    else throw ConfigurationError("unknown base vector '" + parts[1] + "' in strategy '" + name + "'");

    if (parts[2] == "1") d.difference_count = 1;
    else if (parts[2] == "2") d.difference_count = 2;
    else throw ConfigurationError("difference count must be 1 or 2 in strategy '" + name + "'");

    if (parts[3] == "exp") d.crossover = CrossoverScheme::EXPONENTIAL;
    else if (parts[3] == "bin") d.crossover = CrossoverScheme::BINOMIAL;
    else throw ConfigurationError("unknown crossover '" + parts[3] + "' in strategy '" + name + "'");

    if (!find_rule(d.base, d.difference_count)) {
        throw ConfigurationError("strategy '" + name + "' has no mutation rule");
    }
    return d;
}

std::string StrategyDescriptor::to_string() const {
    return std::string("DE/") + base_name(base) + "/" + std::to_string(difference_count) + "/" +
           (crossover == CrossoverScheme::EXPONENTIAL ? "exp" : "bin");
}

const std::vector<std::string>& known_strategies() {
    static const std::vector<std::string> names = {
        "DE/best/1/exp", "DE/rand/1/exp", "DE/rand-to-best/1/exp", "DE/best/2/exp", "DE/rand/2/exp",
        "DE/best/1/bin", "DE/rand/1/bin", "DE/rand-to-best/1/bin", "DE/best/2/bin", "DE/rand/2/bin",
    };
    return names;
}

std::vector<size_t> sample_distinct_indices(size_t n, size_t k, const std::vector<size_t>& forbidden,
                                            std::mt19937& rng) {
    std::vector<size_t> pool;
    pool.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::find(forbidden.begin(), forbidden.end(), i) == forbidden.end()) pool.push_back(i);
    }
    if (pool.size() < k) {
        throw ConfigurationError("cannot draw " + std::to_string(k) + " distinct indices from a population of " +
                                 std::to_string(n) + " with " + std::to_string(n - pool.size()) + " excluded");
    }

    for (size_t j = 0; j < k; ++j) {
        std::uniform_int_distribution<size_t> pick(j, pool.size() - 1);
        std::swap(pool[j], pool[pick(rng)]);
    }
    pool.resize(k);
    return pool;
}

StrategyEngine::StrategyEngine(StrategyDescriptor descriptor, double F, double CR, BinomialTargeting targeting)
: descriptor_(descriptor), F_(F), CR_(CR), targeting_(targeting), rule_(nullptr)
{
    const RuleEntry* entry = find_rule(descriptor_.base, descriptor_.difference_count);
    if (!entry) {
        throw ConfigurationError("strategy '" + descriptor_.to_string() + "' has no mutation rule");
    }
    rule_ = entry->rule;
}

std::vector<Candidate> StrategyEngine::offspring(const Population& population, const Candidate& best,
                                                 std::mt19937& rng) const {
    std::vector<Candidate> result;
    result.reserve(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        auto donors = sample_distinct_indices(population.size(), kDonorCount, {i}, rng);
        result.push_back(trial(population, i, donors, best, rng));
    }
    return result;
}

Candidate StrategyEngine::trial(const Population& population, size_t target, const std::vector<size_t>& donors,
                                const Candidate& best, std::mt19937& rng) const {
    Candidate trial = population.at(target).candidate();
    if (trial.empty()) return trial;

    const bool needs_best = descriptor_.base != BaseVector::RAND;
    if (needs_best && best.size() != trial.size()) {
        throw EvolutionError("strategy " + descriptor_.to_string() + " needs a global best of dimension " +
                             std::to_string(trial.size()));
    }

    MutationInputs in{trial, needs_best ? best : trial, {}, F_};
    for (size_t j = 0; j < kDonorCount; ++j) {
        in.r[j] = &population.at(donors.at(j)).candidate();
    }

    if (descriptor_.crossover == CrossoverScheme::EXPONENTIAL) exponential(trial, in, rng);
    else binomial(trial, in, rng);

    repair(trial, rng);
    return trial;
}

void StrategyEngine::exponential(Candidate& trial, const MutationInputs& in, std::mt19937& rng) const {
    const size_t D = trial.size();
    std::uniform_int_distribution<size_t> dim_dist(0, D - 1);
    std::uniform_real_distribution<double> rand_01(0.0, 1.0);

    size_t n = dim_dist(rng);
    size_t L = 0;
    while (L < D) {
        trial[n] = rule_(in, n);
        n = (n + 1) % D;
        ++L;
        if (CR_ < rand_01(rng)) break;
    }
}

void StrategyEngine::binomial(Candidate& trial, const MutationInputs& in, std::mt19937& rng) const {
    const size_t D = trial.size();
    std::uniform_int_distribution<size_t> dim_dist(0, D - 1);
    std::uniform_real_distribution<double> rand_01(0.0, 1.0);

    size_t n = dim_dist(rng);
    for (size_t L = 0; L < D; ++L) {
        // the last iteration always mutates, so at least one gene changes
        if (rand_01(rng) < CR_ || L + 1 == D) {
            trial[n] = rule_(in, n);
        }
        if (targeting_ == BinomialTargeting::ROTATING) n = (n + 1) % D;
    }
}

void StrategyEngine::repair(Candidate& trial, std::mt19937& rng) {
    std::uniform_real_distribution<double> rand_01(kRepairLower, kRepairUpper);
    for (auto& gene : trial) {
        if (gene > kRepairUpper || gene < kRepairLower) {
            gene = std::round(rand_01(rng) * 1000.0) / 1000.0;
        }
    }
}

}  // namespace evo_optim
