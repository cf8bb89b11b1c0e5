#include "service/SchedulingService.h"
#include "TestFixtures.h"

using namespace RailPlan;
using namespace RailPlan::Schedule;
using RailPlan::Testing::makeSegment;
using RailPlan::Testing::makeTrain;

class SchedulingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.optimizer.populationSize = 12;
        config.optimizer.eliteCount = 2;
        config.pipeline.refinementGenerations = 10;
        service = std::make_unique<SchedulingService>(config);
        ASSERT_TRUE(service->loadNetwork(Testing::corridorStations(), Testing::corridorSegments()));
    }

    Config::SchedulerConfig config;
    std::unique_ptr<SchedulingService> service;
};

TEST_F(SchedulingServiceTest, OperationalOnlyWithValidNetwork) {
    EXPECT_TRUE(service->isOperational());

    QList<Network::TrackSegment> broken = {makeSegment("X", "A", "B", -3.0, 80.0, Network::TrackType::DOUBLE)};
    EXPECT_FALSE(service->loadNetwork(Testing::corridorStations(), broken));
    EXPECT_FALSE(service->isOperational());
}

TEST_F(SchedulingServiceTest, DetectsAndReportsConflicts) {
    QList<Train> fleet = {
        makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RB 2", 3, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(3, "RB 3", 3, referenceTime(8, 0), {"A", "D"})
    };

    int signalled = -1;
    QObject::connect(service.get(), &SchedulingService::conflictsDetected, [&signalled](int count) {
        signalled = count;
    });

    DetectionResult detection = service->detectConflicts(fleet);
    ASSERT_TRUE(detection.success);
    EXPECT_EQ(detection.conflicts.size(), 4);
    EXPECT_EQ(detection.failures.size(), 1);
    EXPECT_EQ(signalled, 4);
    EXPECT_EQ(service->lastConflictCount(), 4);

    QString report = service->generateConflictReport(fleet);
    EXPECT_TRUE(report.contains("Bergen"));
    EXPECT_TRUE(report.contains("Track occupancy (1)"));

    QList<Hotspot> hotspots = service->analyzeHotspots(fleet);
    EXPECT_EQ(hotspots.size(), 4);
}

TEST_F(SchedulingServiceTest, ResolvesLocally) {
    QList<Train> fleet = {
        makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RB 2", 3, referenceTime(8, 0), {"A", "B", "C"})
    };

    Resolution::LocalResolutionResult result = service->resolveLocally(fleet);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(service->detectConflicts(fleet).conflicts.isEmpty());

    // The lower-priority train leaves at least one increment after the other
    EXPECT_EQ(fleet[0].stops[0].departure, referenceTime(8, 0));
    EXPECT_GE(qAbs(fleet[0].stops[0].departure.secsTo(fleet[1].stops[0].departure)), 5 * 60);
}

TEST_F(SchedulingServiceTest, PipelineMergesNewTrains) {
    QList<Train> existing = {makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"})};
    QList<Train> incoming = {makeTrain(2, "RB 2", 3, referenceTime(8, 0), {"A", "B", "C"})};

    bool finished = false;
    QObject::connect(service.get(), &SchedulingService::pipelineFinished, [&finished](bool success, int) {
        finished = success;
    });

    Resolution::PipelineResult result = service->executePipeline(incoming, existing);
    EXPECT_TRUE(result.completed);
    EXPECT_TRUE(finished);
    ASSERT_EQ(result.trains.size(), 2);
    EXPECT_EQ(result.trains[1].id, incoming.first().id);

    QVariantMap stats = service->getStatistics();
    EXPECT_TRUE(stats["isOperational"].toBool());
    EXPECT_FALSE(stats["oracleAttached"].toBool());
}
