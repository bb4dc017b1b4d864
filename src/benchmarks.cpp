#include "evo_optim/benchmarks.hpp"
#include "evo_optim/exceptions.hpp"

#include <cctype>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace evo_optim {

namespace {

std::string normalize(const std::string& s) {
    std::string out;
    for (unsigned char ch : s) if (std::isalnum(ch)) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

}  // namespace

double sphere(const Candidate& x) {
    double s = 0.0;
    for (double v : x) s += v * v;
    return s;
}

double rastrigin(const Candidate& x, double A) {
    double s = 0.0;
    for (double v : x) s += (v * v - A * std::cos(2.0 * M_PI * v));
    return A * static_cast<double>(x.size()) + s;
}

double michalewicz(const Candidate& x, int m) {
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double xi = x[i];
        sum += std::sin(xi) * std::pow(std::sin(((i + 1.0) * xi * xi) / M_PI), 2.0 * m);
    }
    return -sum;
}

double styblinski_tang(const Candidate& x) {
    double s = 0.0;
    for (double v : x) s += std::pow(v, 4) - 16.0 * v * v + 5.0 * v;
    return 0.5 * s;
}

Benchmark make_benchmark(const std::string& name, double rastrigin_A, int michalewicz_m) {
    const std::string key = normalize(name);
    if (key == "sphere") {
        return {"sphere", -5.12, 5.12, [](const Candidate& x) { return sphere(x); }};
    }
    if (key == "rastrigin") {
        return {"rastrigin", -5.12, 5.12, [rastrigin_A](const Candidate& x) { return rastrigin(x, rastrigin_A); }};
    }
    if (key == "michalewicz") {
        return {"michalewicz", 0.0, M_PI, [michalewicz_m](const Candidate& x) { return michalewicz(x, michalewicz_m); }};
    }
    if (key == "styblinskitang") {
        return {"styblinski_tang", -5.0, 5.0, [](const Candidate& x) { return styblinski_tang(x); }};
    }
    throw ConfigurationError("unknown benchmark '" + name + "'");
}

Generator uniform_generator(size_t dimensions, double lower, double upper) {
    if (!(lower < upper)) throw ConfigurationError("uniform generator needs lower < upper");
    return [dimensions, lower, upper](std::mt19937& rng, const EvolutionConfig&) {
        std::uniform_real_distribution<double> dist(lower, upper);
        Candidate c(dimensions);
        for (auto& g : c) g = dist(rng);
        return c;
    };
}

}  // namespace evo_optim
