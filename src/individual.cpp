#include "evo_optim/individual.hpp"
#include "evo_optim/exceptions.hpp"

namespace evo_optim {

Individual::Individual(Candidate candidate, bool maximize)
: candidate_(std::move(candidate)), maximize_(maximize)
{
}

void Individual::set_candidate(Candidate candidate) {
    candidate_ = std::move(candidate);
    fitness_.reset();
    responses_.clear();
}

bool Individual::operator<(const Individual& other) const {
    if (!fitness_ || !other.fitness_) {
        throw ComparisonError("fitness cannot be unset when comparing individuals");
    }
    if (maximize_) return *fitness_ > *other.fitness_;
    return *fitness_ < *other.fitness_;
}

bool Individual::operator==(const Individual& other) const {
    return candidate_ == other.candidate_ && fitness_ == other.fitness_ && maximize_ == other.maximize_;
}

std::ostream& operator<<(std::ostream& os, const Individual& individual) {
    os << "[";
    const auto& c = individual.candidate();
    for (size_t j = 0; j < c.size(); ++j) {
        os << c[j];
        if (j + 1 < c.size()) os << ", ";
    }
    os << "] : ";
    if (individual.fitness()) os << *individual.fitness();
    else os << "undefined";
    for (const auto& [name, value] : individual.responses()) {
        os << ", " << name << "=" << value;
    }
    return os;
}

}  // namespace evo_optim
