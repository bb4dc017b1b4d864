#ifndef EVO_OPTIM__INDIVIDUAL_HPP_
#define EVO_OPTIM__INDIVIDUAL_HPP_

#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace evo_optim {

using Candidate = std::vector<double>;
using Responses = std::map<std::string, double>;

// A candidate solution together with its evaluation.
//
// Individuals compare by fitness and respect the maximize flag: a < b reads
// "a is better than b", so sorting a population ascending puts the best
// individual first. Comparing an individual without fitness throws
// ComparisonError.
class Individual {
public:
    Individual() = default;
    explicit Individual(Candidate candidate, bool maximize = true);

    const Candidate& candidate() const { return candidate_; }
    // Replacing the candidate invalidates the evaluation.
    void set_candidate(Candidate candidate);

    const std::optional<double>& fitness() const { return fitness_; }
    bool has_fitness() const { return fitness_.has_value(); }
    void set_fitness(double fitness) { fitness_ = fitness; }

    const Responses& responses() const { return responses_; }
    void set_responses(Responses responses) { responses_ = std::move(responses); }

    bool maximize() const { return maximize_; }
    std::chrono::system_clock::time_point birthdate() const { return birthdate_; }

    bool operator<(const Individual& other) const;
    bool operator>(const Individual& other) const { return other < *this; }
    bool operator<=(const Individual& other) const { return !(other < *this); }
    bool operator>=(const Individual& other) const { return !(*this < other); }

    bool operator==(const Individual& other) const;
    bool operator!=(const Individual& other) const { return !(*this == other); }

private:
    Candidate candidate_;
    std::optional<double> fitness_;
    Responses responses_;
    bool maximize_ = true;
    std::chrono::system_clock::time_point birthdate_ = std::chrono::system_clock::now();
};

using Population = std::vector<Individual>;

std::ostream& operator<<(std::ostream& os, const Individual& individual);

}  // namespace evo_optim

#endif
