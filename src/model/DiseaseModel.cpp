#include "model/DiseaseModel.hpp"
#include "model/DurationSamplers.hpp"
#include "exceptions/Exceptions.hpp"
#include <cfenv>
#include <cmath>
#include <utility>

namespace netepi {

DiseaseModel::DiseaseModel(double contagiousness)
    : DiseaseModel(contagiousness,
                   std::make_shared<LognormalDurationSampler>(),
                   std::make_shared<LognormalDurationSampler>()) {}

DiseaseModel::DiseaseModel(double contagiousness,
                           std::shared_ptr<const IDurationSampler> incubation_duration,
                           std::shared_ptr<const IDurationSampler> sickness_duration)
    : contagiousness_(contagiousness),
      incubation_duration_(std::move(incubation_duration)),
      sickness_duration_(std::move(sickness_duration)) {
    if (!incubation_duration_) {
        THROW_INVALID_PARAM("DiseaseModel::DiseaseModel", "Incubation duration sampler cannot be null.");
    }
    if (!sickness_duration_) {
        THROW_INVALID_PARAM("DiseaseModel::DiseaseModel", "Sickness duration sampler cannot be null.");
    }
}

int DiseaseModel::sampleIncubationDays(IRandomSource& rng) const {
    return roundDays(incubation_duration_->sample(rng));
}

int DiseaseModel::sampleSicknessDays(IRandomSource& rng) const {
    return roundDays(sickness_duration_->sample(rng));
}

int DiseaseModel::roundDays(double days) {
    const int previous_mode = std::fegetround();
    std::fesetround(FE_TONEAREST);
    const double rounded = std::nearbyint(days);
    std::fesetround(previous_mode);
    return static_cast<int>(rounded);
}

} // namespace netepi
