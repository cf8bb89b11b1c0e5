#pragma once

#include "CancellationToken.h"
#include "../schedule/TimetablePropagator.h"
#include "../schedule/ConflictDetector.h"
#include "../config/SchedulerConfig.h"
#include <QObject>
#include <QSet>
#include <atomic>
#include <limits>
#include <random>

namespace RailPlan::Resolution {

enum class OptimizerStatus {
    IDLE,
    RUNNING,
    CANCELLED,
    CONVERGED,
    EXHAUSTED
};

struct TrainGene {
    QUuid trainId;
    double departureShiftMinutes = 0.0;
    QList<double> extraDwellMinutes;            // per stop
    QList<std::optional<int>> platforms;        // per stop
};

struct Chromosome {
    QList<TrainGene> genes;
    double fitness = std::numeric_limits<double>::max();
    int conflictCount = std::numeric_limits<int>::max();
    QSet<QUuid> conflictingTrainIds;
    int unscheduledTrains = 0;
    bool evaluated = false;
};

struct OptimizationResult {
    bool success = false;
    QString errorCode;
    QString error;
    OptimizerStatus status = OptimizerStatus::IDLE;
    QList<Schedule::Train> trains;              // refined copies of the new trains
    int generations = 0;
    int initialConflictCount = 0;
    int finalConflictCount = 0;
    double bestFitness = std::numeric_limits<double>::max();
    QList<double> bestFitnessHistory;
    QList<Schedule::Conflict> remainingConflicts;
    QList<Schedule::PropagationFailure> failures;   // new trains the best individual could not schedule
};

/*
 * Population search over departure shifts, extra dwell and platform choice for
 * a batch of new trains against a fixed set of existing timetables.
 * fitness = conflicts * conflictWeight + delay minutes * delayWeight + track change penalties
 */
class GeneticOptimizer : public QObject {
    Q_OBJECT
    Q_PROPERTY(int currentGeneration READ currentGeneration NOTIFY progressUpdated)
    Q_PROPERTY(int bestConflictCount READ bestConflictCount NOTIFY progressUpdated)
    Q_PROPERTY(QString status READ statusString NOTIFY statusChanged)

public:
    GeneticOptimizer(
        const Schedule::TimetablePropagator* propagator,
        const Schedule::ConflictDetector& detector,
        const Config::OptimizerConfig& config = Config::OptimizerConfig(),
        QObject* parent = nullptr
    );

    // generationBudget < 0 uses config.maxGenerations
    OptimizationResult optimize(
        const QList<Schedule::Train>& newTrains,
        const QList<Schedule::Timetable>& fixedTimetables,
        int generationBudget = -1,
        const CancellationToken* cancel = nullptr
    );

    int currentGeneration() const { return m_currentGeneration.load(); }
    int bestConflictCount() const { return m_bestConflictCount.load(); }
    OptimizerStatus status() const { return static_cast<OptimizerStatus>(m_status.load()); }
    QString statusString() const;

    void setSeed(quint32 seed) { m_config.seed = seed; }
    const Config::OptimizerConfig& config() const { return m_config; }

signals:
    void progressUpdated(int generation, int bestConflictCount, double bestFitness);
    void statusChanged(const QString& status);

private:
    struct EvaluationContext {
        const QList<Schedule::Train>* newTrains = nullptr;
        const QList<Schedule::Timetable>* fixedTimetables = nullptr;
    };

    Chromosome createIdentityChromosome(const QList<Schedule::Train>& trains) const;
    Chromosome createRandomChromosome(const QList<Schedule::Train>& trains, double intensity);

    void evaluate(Chromosome& chromosome, const EvaluationContext& context) const;
    void evaluatePopulation(QList<Chromosome>& population, const EvaluationContext& context) const;
    QList<Schedule::Train> applyChromosome(const Chromosome& chromosome, const QList<Schedule::Train>& trains) const;

    const Chromosome& selectParent(const QList<Chromosome>& population);
    Chromosome crossover(const Chromosome& first, const Chromosome& second);
    void mutate(Chromosome& chromosome);
    void mutateTrack(TrainGene& gene, const Schedule::Train& train);

    void setStatus(OptimizerStatus status);

    double uniform() { return std::uniform_real_distribution<double>(0.0, 1.0)(m_rng); }
    int uniformInt(int low, int high) { return std::uniform_int_distribution<int>(low, high)(m_rng); }
    bool coinFlip() { return uniform() < 0.5; }

private:
    const Schedule::TimetablePropagator* m_propagator;
    Schedule::ConflictDetector m_detector;
    Config::OptimizerConfig m_config;
    std::mt19937 m_rng;

    const QList<Schedule::Train>* m_activeTrains = nullptr;

    std::atomic<int> m_currentGeneration{0};
    std::atomic<int> m_bestConflictCount{0};
    std::atomic<int> m_status{static_cast<int>(OptimizerStatus::IDLE)};

    static constexpr double CONFLICT_SHIFT_SHARE = 0.6;
    static constexpr double TRACK_CHANGE_SHARE = 0.3;
    static constexpr double NUDGE_SHARE = 0.5;
};

QString optimizerStatusToString(OptimizerStatus status);

} // namespace RailPlan::Resolution
