#include "model/GslRandomSource.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <ctime>
#include <unistd.h>

namespace netepi {

GslRandomSource::GslRandomSource(unsigned long seed)
    : rng_(gsl_rng_alloc(gsl_rng_mt19937)) {
    if (!rng_) {
        THROW_SIMULATION_ERROR("GslRandomSource::GslRandomSource", "Failed to allocate GSL RNG.");
    }
    gsl_rng_set(rng_, seed);
}

GslRandomSource::GslRandomSource()
    : GslRandomSource(static_cast<unsigned long>(time(NULL)) ^ (static_cast<unsigned long>(getpid()) << 16)) {}

GslRandomSource::~GslRandomSource() {
    if (rng_) gsl_rng_free(rng_);
}

void GslRandomSource::seed(unsigned long seed) {
    gsl_rng_set(rng_, seed);
}

double GslRandomSource::uniform() {
    return gsl_rng_uniform(rng_);
}

double GslRandomSource::lognormal(double zeta, double sigma) {
    return gsl_ran_lognormal(rng_, zeta, sigma);
}

std::size_t GslRandomSource::uniformInt(std::size_t n) {
    if (n == 0) {
        THROW_INVALID_PARAM("GslRandomSource::uniformInt", "Upper bound must be positive.");
    }
    return static_cast<std::size_t>(gsl_rng_uniform_int(rng_, static_cast<unsigned long>(n)));
}

} // namespace netepi
