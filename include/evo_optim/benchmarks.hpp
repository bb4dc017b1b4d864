#ifndef EVO_OPTIM__BENCHMARKS_HPP_
#define EVO_OPTIM__BENCHMARKS_HPP_

#include <functional>
#include <string>
#include <vector>

#include "evo_optim/evolution_engine.hpp"
#include "evo_optim/individual.hpp"

namespace evo_optim {

using ObjectiveFunction = std::function<double(const Candidate&)>;

// A test objective and the box it is usually studied on. All of them are
// minimization problems.
struct Benchmark {
    std::string name;
    double lower;
    double upper;
    ObjectiveFunction function;
};

double sphere(const Candidate& x);
double rastrigin(const Candidate& x, double A = 10.0);
double michalewicz(const Candidate& x, int m = 10);
double styblinski_tang(const Candidate& x);

// Looks a benchmark up by name, ignoring case and punctuation
// ("Styblinski-Tang" and "styblinskitang" are the same).
// Throws ConfigurationError for an unknown name.
Benchmark make_benchmark(const std::string& name, double rastrigin_A = 10.0, int michalewicz_m = 10);

// Candidates drawn uniformly from [lower, upper)^dimensions.
Generator uniform_generator(size_t dimensions, double lower, double upper);

}  // namespace evo_optim

#endif
