#pragma once

#include <QString>
#include <QStringList>
#include <QList>
#include <QJsonObject>
#include <QVariantMap>

namespace RailPlan::Config {

struct ResolverConfig {
    double delayIncrementMinutes = 5.0;
    int maxIterations = 15;
};

struct OptimizerConfig {
    int populationSize = 60;
    int maxGenerations = 250;
    int eliteCount = 5;
    int tournamentSize = 2;
    double mutationRate = 0.3;
    double conflictMutationBoost = 2.5;     // rate multiplier for trains in conflict
    double calmMutationDamping = 0.5;       // rate multiplier for the others
    double conflictWeight = 1000000.0;
    double delayWeight = 10.0;
    double trackChangePenalty = 30.0;
    double terminalTrackChangePenalty = 80.0;
    double maxShiftMinutes = 15.0;
    double maxRandomDwellMinutes = 10.0;
    double initialIntensity = 0.3;
    int maxPlatformChoice = 8;
    quint32 seed = 42;
    bool parallelEvaluation = true;
};

struct PipelineConfig {
    int refinementGenerations = 100;
    bool departureSearchEnabled = true;
    int departureSearchRangeMinutes = 60;
    int residualDisplayLimit = 5;
    double oracleConfidenceThreshold = 0.15;
    int oracleRollbackMargin = 2;
};

struct OracleConfig {
    bool enabled = false;
    QString endpoint = "http://localhost:8080/api/v1/optimize";
    QString apiKey;
    QString bearerToken;
    int timeoutMs = 120000;
    int maxIterations = 15;
};

struct SchedulerConfig {
    ResolverConfig resolver;
    OptimizerConfig optimizer;
    PipelineConfig pipeline;
    OracleConfig oracle;

    QStringList validate() const;
    QVariantMap toVariantMap() const;

    // 1, -1, 2, -2, ... up to the configured range
    QList<int> departureShiftCandidates() const;
};

struct ConfigLoadResult {
    bool success = false;
    QString error;
    QStringList validationErrors;
    SchedulerConfig config;
};

class SchedulerConfigLoader {
public:
    static ConfigLoadResult loadFromFile(const QString& path);
    static ConfigLoadResult loadFromJson(const QJsonObject& root);

    // RAILPLAN_ORACLE_ENDPOINT / RAILPLAN_ORACLE_API_KEY / RAILPLAN_ORACLE_TOKEN
    static void applyEnvironmentOverrides(SchedulerConfig& config);

    static constexpr const char* ENV_ORACLE_ENDPOINT = "RAILPLAN_ORACLE_ENDPOINT";
    static constexpr const char* ENV_ORACLE_API_KEY = "RAILPLAN_ORACLE_API_KEY";
    static constexpr const char* ENV_ORACLE_TOKEN = "RAILPLAN_ORACLE_TOKEN";
};

} // namespace RailPlan::Config
