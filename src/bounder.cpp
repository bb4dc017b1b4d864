#include "evo_optim/bounder.hpp"
#include "evo_optim/exceptions.hpp"

#include <algorithm>
#include <cmath>

namespace evo_optim {

std::vector<double> Bound::expand(size_t dimensions) const {
    if (broadcast) return std::vector<double>(dimensions, values.front());
    return values;
}

Bounder::Bounder(Bound lower, Bound upper)
: lower_(std::move(lower)), upper_(std::move(upper))
{
}

Bounder::Bounder(std::nullopt_t, Bound upper)
: upper_(std::move(upper))
{
}

Bounder::Bounder(Bound lower, std::nullopt_t)
: lower_(std::move(lower))
{
}

Candidate Bounder::operator()(Candidate candidate) const {
    if (!is_bounded()) return candidate;

    const std::vector<double> lo = lower_->expand(candidate.size());
    const std::vector<double> hi = upper_->expand(candidate.size());
    // zip semantics: a short explicit bound leaves the remaining genes alone
    const size_t n = std::min({candidate.size(), lo.size(), hi.size()});
    for (size_t i = 0; i < n; ++i) {
        candidate[i] = std::max(std::min(candidate[i], hi[i]), lo[i]);
    }
    return candidate;
}

std::vector<double> Bounder::lower_bound(size_t dimensions) const {
    if (!is_bounded()) return {};
    return lower_->expand(dimensions);
}

std::vector<double> Bounder::upper_bound(size_t dimensions) const {
    if (!is_bounded()) return {};
    return upper_->expand(dimensions);
}

DiscreteBounder::DiscreteBounder(std::vector<double> values)
: values_(std::move(values))
{
    if (values_.empty()) {
        throw ConfigurationError("DiscreteBounder requires at least one legal value");
    }
}

double DiscreteBounder::closest(double target) const {
    double best = values_.front();
    double best_distance = std::fabs(best - target);
    for (double v : values_) {
        double d = std::fabs(v - target);
        // strict comparison keeps the earliest value on ties
        if (d < best_distance) {
            best = v;
            best_distance = d;
        }
    }
    return best;
}

Candidate DiscreteBounder::operator()(Candidate candidate) const {
    for (auto& gene : candidate) gene = closest(gene);
    return candidate;
}

std::vector<double> DiscreteBounder::lower_bound(size_t dimensions) const {
    return std::vector<double>(dimensions, *std::min_element(values_.begin(), values_.end()));
}

std::vector<double> DiscreteBounder::upper_bound(size_t dimensions) const {
    return std::vector<double>(dimensions, *std::max_element(values_.begin(), values_.end()));
}

}  // namespace evo_optim
