#ifndef EVO_OPTIM__BOUNDER_HPP_
#define EVO_OPTIM__BOUNDER_HPP_

#include <memory>
#include <optional>
#include <vector>

#include "evo_optim/individual.hpp"

namespace evo_optim {

// Constraint enforcement for candidates produced by variation operators.
class BoundingFunction {
public:
    virtual ~BoundingFunction() = default;

    virtual Candidate operator()(Candidate candidate) const = 0;

    // Per-dimension limits for a candidate of the given size.
    // Empty when the bounder does not constrain candidates.
    virtual std::vector<double> lower_bound(size_t dimensions) const = 0;
    virtual std::vector<double> upper_bound(size_t dimensions) const = 0;
};

// One side of a Bounder: a scalar broadcast to every dimension or an explicit
// per-dimension sequence.
struct Bound {
    Bound(double value) : values{value}, broadcast(true) {}
    Bound(std::vector<double> per_dimension) : values(std::move(per_dimension)), broadcast(false) {}

    std::vector<double> expand(size_t dimensions) const;

    std::vector<double> values;
    bool broadcast;
};

// Clamps every gene into [lower, upper]. If either side is missing the
// bounder leaves candidates unchanged.
//
// Bounder(0, 1) on [0.2, -0.1, 0.76, 1.3, 0.4] yields [0.2, 0, 0.76, 1, 0.4].
class Bounder : public BoundingFunction {
public:
    Bounder() = default;
    Bounder(Bound lower, Bound upper);
    Bounder(std::nullopt_t, Bound upper);
    Bounder(Bound lower, std::nullopt_t);

    Candidate operator()(Candidate candidate) const override;
    std::vector<double> lower_bound(size_t dimensions) const override;
    std::vector<double> upper_bound(size_t dimensions) const override;

    bool is_bounded() const { return lower_.has_value() && upper_.has_value(); }

private:
    std::optional<Bound> lower_;
    std::optional<Bound> upper_;
};

// Snaps every gene to the nearest member of a finite set of legal values.
// Ties go to the value listed first.
//
// DiscreteBounder({1, 4, 8, 16}) on [6, 10, 13, 3, 4, 0, 1, 12, 2] yields
// [4, 8, 16, 4, 4, 1, 1, 8, 1].
class DiscreteBounder : public BoundingFunction {
public:
    explicit DiscreteBounder(std::vector<double> values);

    Candidate operator()(Candidate candidate) const override;
    std::vector<double> lower_bound(size_t dimensions) const override;
    std::vector<double> upper_bound(size_t dimensions) const override;

    const std::vector<double>& values() const { return values_; }

private:
    double closest(double target) const;

    std::vector<double> values_;
};

using BounderPtr = std::shared_ptr<const BoundingFunction>;

}  // namespace evo_optim

#endif
