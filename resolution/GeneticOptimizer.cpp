#include "GeneticOptimizer.h"
#include "../core/ErrorCodes.h"
#include <QtConcurrent/QtConcurrent>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>

namespace RailPlan::Resolution {

using Schedule::Conflict;
using Schedule::Timetable;
using Schedule::Train;

QString optimizerStatusToString(OptimizerStatus status) {
    switch (status) {
        case OptimizerStatus::IDLE: return "IDLE";
        case OptimizerStatus::RUNNING: return "RUNNING";
        case OptimizerStatus::CANCELLED: return "CANCELLED";
        case OptimizerStatus::CONVERGED: return "CONVERGED";
        case OptimizerStatus::EXHAUSTED: return "EXHAUSTED";
        default: return "UNKNOWN";
    }
}

GeneticOptimizer::GeneticOptimizer(
    const Schedule::TimetablePropagator* propagator,
    const Schedule::ConflictDetector& detector,
    const Config::OptimizerConfig& config,
    QObject* parent
)
    : QObject(parent)
    , m_propagator(propagator)
    , m_detector(detector)
    , m_config(config)
    , m_rng(config.seed)
{
    // Evaluation already runs one chromosome per worker
    m_detector.setParallelEnabled(false);
}

QString GeneticOptimizer::statusString() const {
    return optimizerStatusToString(status());
}

void GeneticOptimizer::setStatus(OptimizerStatus status) {
    m_status.store(static_cast<int>(status));
    emit statusChanged(optimizerStatusToString(status));
}

Chromosome GeneticOptimizer::createIdentityChromosome(const QList<Train>& trains) const {
    Chromosome chromosome;
    for (const Train& train : trains) {
        TrainGene gene;
        gene.trainId = train.id;
        for (const Schedule::Stop& stop : train.stops) {
            gene.extraDwellMinutes.append(stop.extraDwellMinutes);
            gene.platforms.append(stop.platform);
        }
        chromosome.genes.append(gene);
    }
    return chromosome;
}

Chromosome GeneticOptimizer::createRandomChromosome(const QList<Train>& trains, double intensity) {
    Chromosome chromosome = createIdentityChromosome(trains);

    const int maxShift = static_cast<int>(m_config.maxShiftMinutes * intensity);
    const int maxDwell = std::max(1, static_cast<int>(m_config.maxRandomDwellMinutes * intensity));

    for (TrainGene& gene : chromosome.genes) {
        gene.departureShiftMinutes = uniformInt(-maxShift, maxShift);

        // Origin and terminus dwell define boarding windows, only intermediate stops wait longer
        for (int s = 1; s < gene.extraDwellMinutes.size() - 1; ++s) {
            if (uniform() < intensity) {
                gene.extraDwellMinutes[s] += uniformInt(0, maxDwell);
            }
        }
    }
    return chromosome;
}

QList<Train> GeneticOptimizer::applyChromosome(const Chromosome& chromosome, const QList<Train>& trains) const {
    QList<Train> result = trains;

    for (int i = 0; i < result.size() && i < chromosome.genes.size(); ++i) {
        Train& train = result[i];
        const TrainGene& gene = chromosome.genes[i];

        if (gene.departureShiftMinutes != 0.0) {
            train.shiftDeparture(gene.departureShiftMinutes);
        }

        for (int s = 0; s < train.stops.size() && s < gene.extraDwellMinutes.size(); ++s) {
            train.stops[s].extraDwellMinutes = gene.extraDwellMinutes[s];
            train.stops[s].platform = gene.platforms.value(s);
        }
    }

    return result;
}

void GeneticOptimizer::evaluate(Chromosome& chromosome, const EvaluationContext& context) const {
    const QList<Train>& originals = *context.newTrains;
    QList<Train> candidates = applyChromosome(chromosome, originals);

    QList<Timetable> timetables = *context.fixedTimetables;
    QSet<QUuid> candidateIds;
    chromosome.unscheduledTrains = 0;
    for (Train& train : candidates) {
        Schedule::PropagationResult propagated = m_propagator->propagate(train);
        if (propagated.success) {
            timetables.append(propagated.timetable);
            candidateIds.insert(train.id);
        } else {
            chromosome.unscheduledTrains++;
        }
    }

    // A train without a schedule cannot be scored as conflict-free
    if (chromosome.unscheduledTrains > 0) {
        chromosome.conflictingTrainIds.clear();
        chromosome.conflictCount = std::numeric_limits<int>::max();
        chromosome.fitness = std::numeric_limits<double>::max();
        chromosome.evaluated = true;
        return;
    }

    const QList<Conflict> conflicts = m_detector.detect(timetables);

    int relevantConflicts = 0;
    chromosome.conflictingTrainIds.clear();
    for (const Conflict& conflict : conflicts) {
        bool firstNew = candidateIds.contains(conflict.first.trainId);
        bool secondNew = candidateIds.contains(conflict.second.trainId);
        if (!firstNew && !secondNew) {
            continue;
        }
        relevantConflicts++;
        if (firstNew) chromosome.conflictingTrainIds.insert(conflict.first.trainId);
        if (secondNew) chromosome.conflictingTrainIds.insert(conflict.second.trainId);
    }

    double delayMinutes = 0.0;
    double trackPenalty = 0.0;
    for (int i = 0; i < chromosome.genes.size() && i < originals.size(); ++i) {
        const TrainGene& gene = chromosome.genes[i];
        const Train& original = originals[i];

        delayMinutes += std::abs(gene.departureShiftMinutes);

        const int lastIndex = original.stops.size() - 1;
        for (int s = 0; s <= lastIndex && s < gene.extraDwellMinutes.size(); ++s) {
            delayMinutes += std::max(0.0, gene.extraDwellMinutes[s] - original.stops[s].extraDwellMinutes);
            if (gene.platforms.value(s) != original.stops[s].platform) {
                bool terminal = (s == 0 || s == lastIndex);
                trackPenalty += terminal ? m_config.terminalTrackChangePenalty : m_config.trackChangePenalty;
            }
        }
    }

    chromosome.conflictCount = relevantConflicts;
    chromosome.fitness = relevantConflicts * m_config.conflictWeight
                       + delayMinutes * m_config.delayWeight
                       + trackPenalty;
    chromosome.evaluated = true;
}

void GeneticOptimizer::evaluatePopulation(QList<Chromosome>& population, const EvaluationContext& context) const {
    auto evaluateOne = [this, &context](Chromosome& chromosome) {
        if (!chromosome.evaluated) {
            evaluate(chromosome, context);
        }
    };

    if (m_config.parallelEvaluation) {
        QtConcurrent::blockingMap(population, evaluateOne);
    } else {
        for (Chromosome& chromosome : population) {
            evaluateOne(chromosome);
        }
    }
}

const Chromosome& GeneticOptimizer::selectParent(const QList<Chromosome>& population) {
    const int last = population.size() - 1;
    int best = uniformInt(0, last);
    for (int round = 1; round < m_config.tournamentSize; ++round) {
        int challenger = uniformInt(0, last);
        if (population[challenger].fitness < population[best].fitness) {
            best = challenger;
        }
    }
    return population[best];
}

Chromosome GeneticOptimizer::crossover(const Chromosome& first, const Chromosome& second) {
    Chromosome child;
    for (int i = 0; i < first.genes.size(); ++i) {
        child.genes.append(coinFlip() ? first.genes[i] : second.genes[i]);
    }
    // Mutation targets trains that were in conflict in either parent
    child.conflictingTrainIds = first.conflictingTrainIds;
    child.conflictingTrainIds.unite(second.conflictingTrainIds);
    return child;
}

void GeneticOptimizer::mutateTrack(TrainGene& gene, const Train& train) {
    if (gene.platforms.isEmpty() || !m_propagator || !m_propagator->pathService()) {
        return;
    }

    const int stopIndex = uniformInt(0, gene.platforms.size() - 1);
    auto station = m_propagator->pathService()->station(train.stops[stopIndex].stationId);
    if (!station || station->platforms <= 1) {
        return;
    }

    const int choices = std::min(station->platforms, m_config.maxPlatformChoice);
    gene.platforms[stopIndex] = uniformInt(1, choices);
}

void GeneticOptimizer::mutate(Chromosome& chromosome) {
    QList<int> targets;
    for (int i = 0; i < chromosome.genes.size(); ++i) {
        if (chromosome.conflictingTrainIds.contains(chromosome.genes[i].trainId)) {
            targets.append(i);
        }
    }
    if (targets.isEmpty()) {
        for (int i = 0; i < chromosome.genes.size(); ++i) {
            targets.append(i);
        }
    }

    for (int i : targets) {
        TrainGene& gene = chromosome.genes[i];
        const bool conflicting = chromosome.conflictingTrainIds.contains(gene.trainId);
        const double chance = conflicting
            ? m_config.mutationRate * m_config.conflictMutationBoost
            : m_config.mutationRate * m_config.calmMutationDamping;

        if (uniform() >= chance) {
            continue;
        }

        const int intermediateStops = std::max(0, static_cast<int>(gene.extraDwellMinutes.size()) - 2);

        if (conflicting && uniform() < CONFLICT_SHIFT_SHARE) {
            gene.departureShiftMinutes += uniformInt(1, 10) * (coinFlip() ? 1 : -1);
            continue;
        }

        const double r = uniform();
        if (r < TRACK_CHANGE_SHARE) {
            mutateTrack(gene, (*m_activeTrains)[i]);
        } else if (intermediateStops == 0) {
            gene.departureShiftMinutes += uniformInt(1, 10) * (coinFlip() ? 1 : -1);
        } else if (r < NUDGE_SHARE) {
            const int s = uniformInt(1, intermediateStops);
            const double nudge = (coinFlip() ? 0.5 : 1.0) * (coinFlip() ? 1.0 : -1.0);
            gene.extraDwellMinutes[s] = std::max(0.0, gene.extraDwellMinutes[s] + nudge);
        } else {
            const int s = uniformInt(1, intermediateStops);
            gene.extraDwellMinutes[s] = std::max(0.0, gene.extraDwellMinutes[s] + uniformInt(-1, 3));
        }
    }

    chromosome.evaluated = false;
    chromosome.fitness = std::numeric_limits<double>::max();
}

OptimizationResult GeneticOptimizer::optimize(
    const QList<Train>& newTrains,
    const QList<Timetable>& fixedTimetables,
    int generationBudget,
    const CancellationToken* cancel
) {
    OptimizationResult result;
    result.trains = newTrains;

    if (!m_propagator) {
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = "Optimizer has no propagator";
        qCritical() << "[GeneticOptimizer > optimize]" << result.error;
        return result;
    }

    if (newTrains.isEmpty()) {
        result.success = true;
        result.status = OptimizerStatus::CONVERGED;
        return result;
    }

    // Unschedulable trains make every individual the worst one, so stop before searching
    for (const Train& train : newTrains) {
        Train copy = train;
        Schedule::PropagationResult propagated = m_propagator->propagate(copy);
        if (!propagated.success) {
            result.failures.append(Schedule::PropagationFailure{train.id, train.name, propagated.errorCode, propagated.error});
        }
    }
    if (!result.failures.isEmpty()) {
        result.errorCode = result.failures.first().errorCode;
        result.error = QString("%1 new trains cannot be scheduled, first: %2")
                           .arg(result.failures.size()).arg(result.failures.first().error);
        qWarning() << "[GeneticOptimizer > optimize]" << result.error;
        return result;
    }

    const int budget = generationBudget < 0 ? m_config.maxGenerations : generationBudget;
    const int populationSize = std::max(2, m_config.populationSize);
    const int eliteCount = std::clamp(m_config.eliteCount, 1, populationSize - 1);

    QElapsedTimer timer;
    timer.start();

    m_rng.seed(m_config.seed);
    m_activeTrains = &newTrains;
    m_currentGeneration.store(0);
    setStatus(OptimizerStatus::RUNNING);

    EvaluationContext context;
    context.newTrains = &newTrains;
    context.fixedTimetables = &fixedTimetables;

    QList<Chromosome> population;
    population.append(createIdentityChromosome(newTrains));
    for (int i = 1; i < populationSize; ++i) {
        population.append(createRandomChromosome(newTrains, m_config.initialIntensity));
    }

    OptimizerStatus finalStatus = OptimizerStatus::EXHAUSTED;
    bool evaluatedOnce = false;

    for (int generation = 0; ; ++generation) {
        if (cancel && cancel->isCancelled()) {
            finalStatus = OptimizerStatus::CANCELLED;
            break;
        }

        evaluatePopulation(population, context);
        if (!evaluatedOnce) {
            // Identity chromosome sits at index 0 until the first sort
            result.initialConflictCount = population.first().conflictCount;
            evaluatedOnce = true;
        }

        std::stable_sort(population.begin(), population.end(), [](const Chromosome& a, const Chromosome& b) {
            return a.fitness < b.fitness;
        });

        const Chromosome& best = population.first();

        result.generations = generation + 1;
        result.bestFitnessHistory.append(best.fitness);
        m_currentGeneration.store(generation);
        m_bestConflictCount.store(best.conflictCount);
        emit progressUpdated(generation, best.conflictCount, best.fitness);

        if (best.conflictCount == 0) {
            finalStatus = OptimizerStatus::CONVERGED;
            break;
        }
        if (generation + 1 >= budget) {
            finalStatus = OptimizerStatus::EXHAUSTED;
            break;
        }

        QList<Chromosome> nextGeneration = population.mid(0, eliteCount);
        while (nextGeneration.size() < populationSize) {
            const Chromosome& first = selectParent(population);
            const Chromosome& second = selectParent(population);
            Chromosome child = crossover(first, second);
            mutate(child);
            nextGeneration.append(child);
        }
        population = nextGeneration;
    }

    m_activeTrains = nullptr;

    if (evaluatedOnce) {
        const Chromosome& best = population.first();
        QList<Train> refined = applyChromosome(best, newTrains);
        QList<Timetable> merged = fixedTimetables;
        QSet<QUuid> newIds;

        for (int i = 0; i < refined.size() && i < best.genes.size(); ++i) {
            const TrainGene& gene = best.genes[i];
            double added = gene.departureShiftMinutes;
            for (int s = 0; s < gene.extraDwellMinutes.size() && s < newTrains[i].stops.size(); ++s) {
                added += std::max(0.0, gene.extraDwellMinutes[s] - newTrains[i].stops[s].extraDwellMinutes);
            }
            refined[i].totalDelayMinutes += added;
            newIds.insert(refined[i].id);

            Schedule::PropagationResult propagated = m_propagator->propagate(refined[i]);
            if (propagated.success) {
                merged.append(propagated.timetable);
            } else {
                result.failures.append(Schedule::PropagationFailure{
                    refined[i].id, refined[i].name, propagated.errorCode, propagated.error});
            }
        }

        for (const Conflict& conflict : m_detector.detect(merged)) {
            if (newIds.contains(conflict.first.trainId) || newIds.contains(conflict.second.trainId)) {
                result.remainingConflicts.append(conflict);
            }
        }
        Schedule::ConflictDetector::sortConflicts(result.remainingConflicts);

        result.trains = refined;
        result.bestFitness = best.fitness;
        result.finalConflictCount = best.conflictCount;
    }

    result.status = finalStatus;
    setStatus(finalStatus);

    if (!result.failures.isEmpty() && finalStatus != OptimizerStatus::CANCELLED) {
        result.errorCode = result.failures.first().errorCode;
        result.error = result.failures.first().error;
        qWarning() << "[GeneticOptimizer > optimize] Best individual leaves" << result.failures.size()
                   << "trains unscheduled";
        return result;
    }

    switch (finalStatus) {
        case OptimizerStatus::CONVERGED:
            result.success = true;
            qDebug() << "[GeneticOptimizer > optimize] Zero conflicts at generation" << result.generations
                     << "in" << timer.elapsed() << "ms";
            break;
        case OptimizerStatus::CANCELLED:
            result.errorCode = ErrorCode::CANCELLED;
            result.error = QString("Optimization cancelled after %1 generations").arg(result.generations);
            qDebug() << "[GeneticOptimizer > optimize]" << result.error;
            break;
        default:
            result.errorCode = ErrorCode::OPTIMIZATION_INCOMPLETE;
            result.error = QString("%1 conflicts remain after %2 generations")
                               .arg(result.finalConflictCount).arg(result.generations);
            qWarning() << "[GeneticOptimizer > optimize]" << result.error;
            break;
    }

    return result;
}

} // namespace RailPlan::Resolution
