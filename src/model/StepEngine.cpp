#include "model/StepEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <set>
#include <string>
#include <utility>

namespace netepi {

StepEngine::StepEngine(std::shared_ptr<const DiseaseModel> disease, std::shared_ptr<IRandomSource> rng)
    : disease_(std::move(disease)), rng_(std::move(rng)) {
    if (!disease_) {
        THROW_INVALID_PARAM("StepEngine::StepEngine", "Disease model pointer cannot be null.");
    }
    if (!rng_) {
        THROW_INVALID_PARAM("StepEngine::StepEngine", "Random source pointer cannot be null.");
    }
}

void StepEngine::updateIncubations(Population& population, DayTransitions& transitions) {
    const ContactNetwork& network = population.getNetwork();
    const NodeSet& susceptible = population.susceptible();
    const double contagiousness = disease_->getContagiousness();
    std::set<NodeId> contaminated_today;

    for (auto& entry : population.incubating()) {
        const NodeId case_id = entry.first;
        for (NodeId person : network.neighbors(case_id)) {
            if (susceptible.count(person) == 0 || contaminated_today.count(person) != 0) {
                continue;
            }
            if (rng_->uniform() < contagiousness) {
                contaminated_today.insert(person);
                transitions.new_contaminations.push_back(person);
            }
        }
        if (entry.second == 0) {
            transitions.new_sicknesses.push_back(case_id);
        } else {
            entry.second -= 1;
        }
    }
}

void StepEngine::updateSicknesses(Population& population, DayTransitions& transitions) {
    for (auto& entry : population.sick()) {
        if (entry.second == 0) {
            transitions.new_recoveries.push_back(entry.first);
        } else {
            entry.second -= 1;
        }
    }
}

void StepEngine::commit(Population& population, const DayTransitions& transitions) {
    for (NodeId case_id : transitions.new_sicknesses) {
        if (population.incubating().erase(case_id) == 0) {
            THROW_STATE_CORRUPTION("StepEngine::commit",
                                   "Case " + std::to_string(case_id) + " becoming sick is not incubating.");
        }
        population.sick()[case_id] = disease_->sampleIncubationDays(*rng_);
    }
    for (NodeId person : transitions.new_contaminations) {
        if (population.susceptible().erase(person) == 0) {
            THROW_STATE_CORRUPTION("StepEngine::commit",
                                   "Individual " + std::to_string(person) + " contaminated but not susceptible.");
        }
        population.incubating()[person] = disease_->sampleSicknessDays(*rng_);
    }
    for (NodeId case_id : transitions.new_recoveries) {
        if (population.sick().erase(case_id) == 0) {
            THROW_STATE_CORRUPTION("StepEngine::commit",
                                   "Case " + std::to_string(case_id) + " recovering is not sick.");
        }
        population.recovered().insert(case_id);
    }
}

DayTransitions StepEngine::simulateDay(Population& population) {
    DayTransitions transitions;
    updateIncubations(population, transitions);
    updateSicknesses(population, transitions);
    commit(population, transitions);

    Logger::getInstance().debug("StepEngine::simulateDay",
                                "contaminations=" + std::to_string(transitions.new_contaminations.size()) +
                                " sicknesses=" + std::to_string(transitions.new_sicknesses.size()) +
                                " recoveries=" + std::to_string(transitions.new_recoveries.size()));
    return transitions;
}

} // namespace netepi
