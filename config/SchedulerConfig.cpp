#include "SchedulerConfig.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>
#include <QtGlobal>

namespace RailPlan::Config {

namespace {

void readDouble(const QJsonObject& obj, const char* key, double& target) {
    if (obj.contains(key) && obj[key].isDouble()) {
        target = obj[key].toDouble();
    }
}

void readInt(const QJsonObject& obj, const char* key, int& target) {
    if (obj.contains(key) && obj[key].isDouble()) {
        target = obj[key].toInt();
    }
}

void readBool(const QJsonObject& obj, const char* key, bool& target) {
    if (obj.contains(key) && obj[key].isBool()) {
        target = obj[key].toBool();
    }
}

void readString(const QJsonObject& obj, const char* key, QString& target) {
    if (obj.contains(key) && obj[key].isString()) {
        target = obj[key].toString();
    }
}

} // namespace

QStringList SchedulerConfig::validate() const {
    QStringList errors;

    if (resolver.delayIncrementMinutes <= 0.0) {
        errors.append("resolver.delayIncrementMinutes must be positive");
    }
    if (resolver.maxIterations < 1) {
        errors.append("resolver.maxIterations must be at least 1");
    }

    if (optimizer.populationSize < 2) {
        errors.append("optimizer.populationSize must be at least 2");
    }
    if (optimizer.maxGenerations < 0) {
        errors.append("optimizer.maxGenerations must not be negative");
    }
    if (optimizer.eliteCount < 1 || optimizer.eliteCount >= optimizer.populationSize) {
        errors.append("optimizer.eliteCount must be between 1 and populationSize - 1");
    }
    if (optimizer.tournamentSize < 1) {
        errors.append("optimizer.tournamentSize must be at least 1");
    }
    if (optimizer.mutationRate < 0.0 || optimizer.mutationRate > 1.0) {
        errors.append("optimizer.mutationRate must be within [0, 1]");
    }
    if (optimizer.conflictWeight <= optimizer.delayWeight) {
        errors.append("optimizer.conflictWeight must exceed optimizer.delayWeight");
    }
    if (optimizer.maxShiftMinutes < 0.0 || optimizer.maxRandomDwellMinutes < 0.0) {
        errors.append("optimizer shift and dwell ranges must not be negative");
    }
    if (optimizer.maxPlatformChoice < 1) {
        errors.append("optimizer.maxPlatformChoice must be at least 1");
    }

    if (pipeline.refinementGenerations < 0) {
        errors.append("pipeline.refinementGenerations must not be negative");
    }
    if (pipeline.departureSearchRangeMinutes < 0) {
        errors.append("pipeline.departureSearchRangeMinutes must not be negative");
    }
    if (pipeline.residualDisplayLimit < 0) {
        errors.append("pipeline.residualDisplayLimit must not be negative");
    }
    if (pipeline.oracleConfidenceThreshold < 0.0 || pipeline.oracleConfidenceThreshold > 1.0) {
        errors.append("pipeline.oracleConfidenceThreshold must be within [0, 1]");
    }

    if (oracle.timeoutMs <= 0) {
        errors.append("oracle.timeoutMs must be positive");
    }
    if (oracle.enabled && oracle.endpoint.isEmpty()) {
        errors.append("oracle.endpoint is required when the oracle is enabled");
    }

    return errors;
}

QList<int> SchedulerConfig::departureShiftCandidates() const {
    QList<int> shifts;
    for (int minutes = 1; minutes <= pipeline.departureSearchRangeMinutes; ++minutes) {
        shifts.append(minutes);
        shifts.append(-minutes);
    }
    return shifts;
}

QVariantMap SchedulerConfig::toVariantMap() const {
    return QVariantMap{
        {"resolver", QVariantMap{
            {"delayIncrementMinutes", resolver.delayIncrementMinutes},
            {"maxIterations", resolver.maxIterations}
        }},
        {"optimizer", QVariantMap{
            {"populationSize", optimizer.populationSize},
            {"maxGenerations", optimizer.maxGenerations},
            {"eliteCount", optimizer.eliteCount},
            {"mutationRate", optimizer.mutationRate},
            {"conflictWeight", optimizer.conflictWeight},
            {"delayWeight", optimizer.delayWeight},
            {"seed", optimizer.seed}
        }},
        {"pipeline", QVariantMap{
            {"refinementGenerations", pipeline.refinementGenerations},
            {"departureSearchEnabled", pipeline.departureSearchEnabled},
            {"residualDisplayLimit", pipeline.residualDisplayLimit},
            {"oracleConfidenceThreshold", pipeline.oracleConfidenceThreshold}
        }},
        {"oracle", QVariantMap{
            {"enabled", oracle.enabled},
            {"endpoint", oracle.endpoint},
            {"hasApiKey", !oracle.apiKey.isEmpty()},
            {"timeoutMs", oracle.timeoutMs}
        }}
    };
}

ConfigLoadResult SchedulerConfigLoader::loadFromFile(const QString& path) {
    ConfigLoadResult result;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        result.error = QString("Cannot open scheduler config file: %1").arg(path);
        qCritical() << "[SchedulerConfigLoader > loadFromFile]" << result.error;
        return result;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        result.error = QString("Invalid JSON in scheduler config: %1").arg(parseError.errorString());
        qCritical() << "[SchedulerConfigLoader > loadFromFile]" << result.error;
        return result;
    }
    if (!doc.isObject()) {
        result.error = "Scheduler config root must be an object";
        qCritical() << "[SchedulerConfigLoader > loadFromFile]" << result.error;
        return result;
    }

    return loadFromJson(doc.object());
}

ConfigLoadResult SchedulerConfigLoader::loadFromJson(const QJsonObject& root) {
    ConfigLoadResult result;
    SchedulerConfig& config = result.config;

    const QJsonObject resolver = root["resolver"].toObject();
    readDouble(resolver, "delay_increment_minutes", config.resolver.delayIncrementMinutes);
    readInt(resolver, "max_iterations", config.resolver.maxIterations);

    const QJsonObject optimizer = root["optimizer"].toObject();
    readInt(optimizer, "population_size", config.optimizer.populationSize);
    readInt(optimizer, "max_generations", config.optimizer.maxGenerations);
    readInt(optimizer, "elite_count", config.optimizer.eliteCount);
    readInt(optimizer, "tournament_size", config.optimizer.tournamentSize);
    readDouble(optimizer, "mutation_rate", config.optimizer.mutationRate);
    readDouble(optimizer, "conflict_mutation_boost", config.optimizer.conflictMutationBoost);
    readDouble(optimizer, "calm_mutation_damping", config.optimizer.calmMutationDamping);
    readDouble(optimizer, "conflict_weight", config.optimizer.conflictWeight);
    readDouble(optimizer, "delay_weight", config.optimizer.delayWeight);
    readDouble(optimizer, "track_change_penalty", config.optimizer.trackChangePenalty);
    readDouble(optimizer, "terminal_track_change_penalty", config.optimizer.terminalTrackChangePenalty);
    readDouble(optimizer, "max_shift_minutes", config.optimizer.maxShiftMinutes);
    readDouble(optimizer, "max_random_dwell_minutes", config.optimizer.maxRandomDwellMinutes);
    readDouble(optimizer, "initial_intensity", config.optimizer.initialIntensity);
    readInt(optimizer, "max_platform_choice", config.optimizer.maxPlatformChoice);
    readBool(optimizer, "parallel_evaluation", config.optimizer.parallelEvaluation);
    if (optimizer.contains("seed") && optimizer["seed"].isDouble()) {
        config.optimizer.seed = static_cast<quint32>(optimizer["seed"].toDouble());
    }

    const QJsonObject pipeline = root["pipeline"].toObject();
    readInt(pipeline, "refinement_generations", config.pipeline.refinementGenerations);
    readBool(pipeline, "departure_search_enabled", config.pipeline.departureSearchEnabled);
    readInt(pipeline, "departure_search_range_minutes", config.pipeline.departureSearchRangeMinutes);
    readInt(pipeline, "residual_display_limit", config.pipeline.residualDisplayLimit);
    readDouble(pipeline, "oracle_confidence_threshold", config.pipeline.oracleConfidenceThreshold);
    readInt(pipeline, "oracle_rollback_margin", config.pipeline.oracleRollbackMargin);

    const QJsonObject oracle = root["oracle"].toObject();
    readBool(oracle, "enabled", config.oracle.enabled);
    readString(oracle, "endpoint", config.oracle.endpoint);
    readString(oracle, "api_key", config.oracle.apiKey);
    readInt(oracle, "timeout_ms", config.oracle.timeoutMs);
    readInt(oracle, "max_iterations", config.oracle.maxIterations);

    applyEnvironmentOverrides(config);

    result.validationErrors = config.validate();
    if (!result.validationErrors.isEmpty()) {
        result.error = QString("Scheduler config has %1 invalid values").arg(result.validationErrors.size());
        for (const QString& error : result.validationErrors) {
            qWarning() << "[SchedulerConfigLoader > loadFromJson]" << error;
        }
        return result;
    }

    result.success = true;
    return result;
}

void SchedulerConfigLoader::applyEnvironmentOverrides(SchedulerConfig& config) {
    if (qEnvironmentVariableIsSet(ENV_ORACLE_ENDPOINT)) {
        config.oracle.endpoint = qEnvironmentVariable(ENV_ORACLE_ENDPOINT);
    }
    if (qEnvironmentVariableIsSet(ENV_ORACLE_API_KEY)) {
        config.oracle.apiKey = qEnvironmentVariable(ENV_ORACLE_API_KEY);
    }
    if (qEnvironmentVariableIsSet(ENV_ORACLE_TOKEN)) {
        config.oracle.bearerToken = qEnvironmentVariable(ENV_ORACLE_TOKEN);
    }
}

} // namespace RailPlan::Config
