#include "resolution/PriorityResolver.h"
#include "core/ErrorCodes.h"
#include "TestFixtures.h"

using namespace RailPlan::Schedule;
using namespace RailPlan::Resolution;
using RailPlan::Testing::CorridorTest;
using RailPlan::Testing::makeTrain;

namespace {

ConflictParty party(int number, int priority, const QString& id) {
    ConflictParty p;
    p.trainId = QUuid(id);
    p.trainNumber = number;
    p.priority = priority;
    return p;
}

} // namespace

class PriorityResolverTest : public CorridorTest {
protected:
    void SetUp() override {
        CorridorTest::SetUp();
        propagator = std::make_unique<TimetablePropagator>(&graph);
        detector = std::make_unique<ConflictDetector>(&graph);
    }

    std::unique_ptr<TimetablePropagator> propagator;
    std::unique_ptr<ConflictDetector> detector;
};

TEST(PriorityResolverRules, LowerPriorityYields) {
    Conflict conflict;
    conflict.first = party(10, 8, "{00000000-0000-0000-0000-000000000001}");
    conflict.second = party(20, 3, "{00000000-0000-0000-0000-000000000002}");
    EXPECT_EQ(PriorityResolver::choosePartyToDelay(conflict).trainNumber, 20);
}

TEST(PriorityResolverRules, TieBreaksOnNumberThenId) {
    Conflict conflict;
    conflict.first = party(30, 5, "{00000000-0000-0000-0000-000000000001}");
    conflict.second = party(20, 5, "{00000000-0000-0000-0000-000000000002}");
    EXPECT_EQ(PriorityResolver::choosePartyToDelay(conflict).trainNumber, 30);

    conflict.second = party(30, 5, "{00000000-0000-0000-0000-000000000002}");
    EXPECT_EQ(PriorityResolver::choosePartyToDelay(conflict).trainId,
              QUuid("{00000000-0000-0000-0000-000000000002}"));
}

TEST(PriorityResolverRules, DelayAtOriginShiftsDeparture) {
    Train train = makeTrain(1, "RB 1", 5, referenceTime(8, 0), {"A", "B", "C"});

    PriorityResolver::delayFromStop(train, 0, 5.0);
    EXPECT_EQ(train.departureTime, referenceTime(8, 5));
    EXPECT_DOUBLE_EQ(train.totalDelayMinutes, 5.0);

    PriorityResolver::delayFromStop(train, 1, 5.0);
    EXPECT_DOUBLE_EQ(train.stops[1].extraDwellMinutes, 5.0);
    EXPECT_DOUBLE_EQ(train.totalDelayMinutes, 10.0);
}

TEST(PriorityResolverRules, SkippedStopPassesDelayBack) {
    Train train = makeTrain(1, "RB 1", 5, referenceTime(8, 0), {"A", "B", "C"});
    train.stops[1].isSkipped = true;

    ASSERT_TRUE(PriorityResolver::delayFromStop(train, 1, 5.0));
    EXPECT_DOUBLE_EQ(train.stops[1].extraDwellMinutes, 0.0);
    EXPECT_EQ(train.departureTime, referenceTime(8, 5));
}

TEST(PriorityResolverRules, PinnedTimesMoveWithTheDelay) {
    Train train = makeTrain(1, "RB 1", 5, referenceTime(8, 0), {"A", "B", "C"});
    train.stops[0].plannedDeparture = referenceTime(8, 0);
    train.stops[2].plannedArrival = referenceTime(8, 30);

    ASSERT_TRUE(PriorityResolver::delayFromStop(train, 0, 5.0));
    EXPECT_EQ(train.stops[0].plannedDeparture, referenceTime(8, 5));
    EXPECT_EQ(train.stops[2].plannedArrival, referenceTime(8, 35));
}

TEST(PriorityResolverRules, DelayPastMidnightKeepsTheDayOffset) {
    Train train = makeTrain(1, "RB 1", 5, referenceTime(23, 58), {"A", "B", "C"});

    ASSERT_TRUE(PriorityResolver::delayFromStop(train, 0, 5.0));
    EXPECT_EQ(train.departureTime, referenceTime(23, 58).addSecs(300));
    EXPECT_GT(train.departureTime, referenceTime(23, 58));
}

TEST_F(PriorityResolverTest, PinnedOriginDepartureActuallyMoves) {
    QList<Train> trains = {
        makeTrain(100, "IC 100", 9, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(200, "RB 200", 2, referenceTime(8, 0), {"A", "B", "C"})
    };
    trains[1].stops[0].plannedDeparture = referenceTime(8, 0);

    PriorityResolver resolver(propagator.get(), detector.get());
    LocalResolutionResult result = resolver.resolve(trains);

    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(trains[1].stops[0].departure,
              referenceTime(8, 0).addSecs(qRound64(trains[1].totalDelayMinutes * 60.0)));
}

TEST_F(PriorityResolverTest, SkippedStopConflictIsResolvedAtOrigin) {
    // X passes Bergen without stopping just as Y leaves it for the single track
    QList<Train> trains = {
        makeTrain(1, "X", 2, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "Y", 9, referenceTime(8, 6, 7), {"B", "C"})
    };
    trains[0].stops[1].isSkipped = true;

    PriorityResolver resolver(propagator.get(), detector.get());
    LocalResolutionResult result = resolver.resolve(trains);

    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(result.state, ResolverState::CONVERGED);
    EXPECT_EQ(trains[0].departureTime, referenceTime(8, 10));
    EXPECT_EQ(trains[0].stops[0].departure, referenceTime(8, 10));
    EXPECT_DOUBLE_EQ(trains[0].stops[1].extraDwellMinutes, 0.0);
    EXPECT_DOUBLE_EQ(result.delayAppliedMinutes.value(trains[0].id), 10.0);
    EXPECT_EQ(trains[1].departureTime, referenceTime(8, 6, 7));
}

TEST_F(PriorityResolverTest, LowerPriorityDelayNeverDecreases) {
    double previousDelay = 0.0;
    QDateTime previousDeparture = referenceTime(8, 0);

    for (int budget = 1; budget <= 5; ++budget) {
        QList<Train> trains = {
            makeTrain(100, "IC 100", 9, referenceTime(8, 0), {"A", "B", "C"}),
            makeTrain(200, "RB 200", 2, referenceTime(8, 0), {"A", "B", "C"})
        };

        RailPlan::Config::ResolverConfig config;
        config.maxIterations = budget;
        config.delayIncrementMinutes = 1.0;

        PriorityResolver resolver(propagator.get(), detector.get(), config);
        resolver.resolve(trains);
        propagator->refreshSchedules(trains);

        EXPECT_GE(trains[1].totalDelayMinutes, previousDelay) << "budget " << budget;
        EXPECT_GE(trains[1].stops[0].departure, previousDeparture) << "budget " << budget;
        EXPECT_EQ(trains[0].stops[0].departure, referenceTime(8, 0));

        previousDelay = trains[1].totalDelayMinutes;
        previousDeparture = trains[1].stops[0].departure;
    }
}

TEST_F(PriorityResolverTest, ConvergesWithoutTouchingHigherPriorityTrain) {
    QList<Train> trains = {
        makeTrain(100, "IC 100", 9, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(200, "RB 200", 2, referenceTime(8, 0), {"A", "B", "C"})
    };

    PriorityResolver resolver(propagator.get(), detector.get());
    LocalResolutionResult result = resolver.resolve(trains);

    ASSERT_TRUE(result.success) << result.error.toStdString();
    EXPECT_EQ(result.state, ResolverState::CONVERGED);
    EXPECT_GT(result.initialConflictCount, 0);
    EXPECT_TRUE(result.remainingConflicts.isEmpty());

    EXPECT_EQ(trains[0].departureTime, referenceTime(8, 0));
    EXPECT_DOUBLE_EQ(trains[0].totalDelayMinutes, 0.0);
    EXPECT_FALSE(result.delayAppliedMinutes.contains(trains[0].id));

    EXPECT_GT(trains[1].totalDelayMinutes, 0.0);
    EXPECT_DOUBLE_EQ(result.delayAppliedMinutes.value(trains[1].id), trains[1].totalDelayMinutes);

    FleetRefreshResult refreshed = propagator->refreshSchedules(trains);
    EXPECT_TRUE(detector->detect(refreshed.timetables).isEmpty());

    const qint64 gap = trains[0].stops[0].departure.secsTo(trains[1].stops[0].departure);
    EXPECT_GE(gap, 5 * 60);
}

TEST_F(PriorityResolverTest, ConflictFreeFleetIsLeftAlone) {
    QList<Train> trains = {
        makeTrain(1, "RE 1", 5, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RE 2", 5, referenceTime(10, 0), {"A", "B", "C"})
    };

    PriorityResolver resolver(propagator.get(), detector.get());
    LocalResolutionResult result = resolver.resolve(trains);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_EQ(trains[1].departureTime, referenceTime(10, 0));
}

TEST_F(PriorityResolverTest, ReportsExhaustion) {
    QList<Train> trains = {
        makeTrain(1, "RE 1", 5, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RE 2", 4, referenceTime(8, 0), {"A", "B", "C"})
    };

    RailPlan::Config::ResolverConfig config;
    config.maxIterations = 1;
    config.delayIncrementMinutes = 0.5;

    PriorityResolver resolver(propagator.get(), detector.get(), config);
    LocalResolutionResult result = resolver.resolve(trains);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.state, ResolverState::EXHAUSTED);
    EXPECT_EQ(result.errorCode, RailPlan::ErrorCode::RESOLUTION_EXHAUSTED);
    EXPECT_FALSE(result.remainingConflicts.isEmpty());
}

TEST_F(PriorityResolverTest, HonoursCancellation) {
    QList<Train> trains = {
        makeTrain(1, "RE 1", 5, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RE 2", 4, referenceTime(8, 0), {"A", "B", "C"})
    };

    CancellationToken token;
    token.cancel();

    PriorityResolver resolver(propagator.get(), detector.get());
    LocalResolutionResult result = resolver.resolve(trains, &token);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, RailPlan::ErrorCode::CANCELLED);
}
