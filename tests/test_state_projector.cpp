#include <QtTest/QtTest>

#include "common/json_utils.hpp"
#include "store/state_projector.hpp"

using streakguard::StateProjector;

class StateProjectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testTriggerStartsStreakWithoutCountingReset();
    void testManualResetCountsAndRecordsActor();
    void testBestStreakOnlyGrowsOnLongerStreak();
    void testUndoEventLeavesStateUntouched();
    void testFoldSkipsNullifiedEvents();
    void testFoldUpperBound();

private:
    static streakguard::Event trigger(streakguard::EventId id, std::int64_t seconds);
    static streakguard::Event manualReset(streakguard::EventId id, std::int64_t seconds,
                                          const std::string &reason);
    static streakguard::Event undo(streakguard::EventId id, std::int64_t seconds,
                                   std::vector<streakguard::EventId> targets);
};

streakguard::Event StateProjectorTests::trigger(streakguard::EventId id, std::int64_t seconds)
{
    streakguard::Event event;
    event.id = id;
    event.chatId = 1;
    event.actor = streakguard::Actor{100 + id, "user"};
    event.timestamp = streakguard::fromEpochMillis(seconds * 1000);
    streakguard::TriggerDetails details;
    details.matchedWord = "test";
    details.canonical = "test";
    event.details = details;
    return event;
}

streakguard::Event StateProjectorTests::manualReset(streakguard::EventId id,
                                                    std::int64_t seconds,
                                                    const std::string &reason)
{
    streakguard::Event event;
    event.id = id;
    event.chatId = 1;
    event.actor = streakguard::Actor{7, "moderator"};
    event.timestamp = streakguard::fromEpochMillis(seconds * 1000);
    event.details = streakguard::ManualResetDetails{reason};
    return event;
}

streakguard::Event StateProjectorTests::undo(streakguard::EventId id,
                                             std::int64_t seconds,
                                             std::vector<streakguard::EventId> targets)
{
    streakguard::Event event;
    event.id = id;
    event.chatId = 1;
    event.timestamp = streakguard::fromEpochMillis(seconds * 1000);
    event.details = streakguard::UndoDetails{std::move(targets)};
    return event;
}

void StateProjectorTests::testTriggerStartsStreakWithoutCountingReset()
{
    const auto state = StateProjector::apply(streakguard::ChatState{}, trigger(1, 100));
    QVERIFY(state.streakStart.has_value());
    QCOMPARE(streakguard::toEpochMillis(*state.streakStart), static_cast<std::int64_t>(100000));
    QCOMPARE(state.totalResetCount, static_cast<std::int64_t>(0));
    QCOMPARE(state.bestStreakSeconds, static_cast<std::int64_t>(0));
    QVERIFY(state.lastResetEventId.has_value());
    QCOMPARE(*state.lastResetEventId, static_cast<streakguard::EventId>(1));
}

void StateProjectorTests::testManualResetCountsAndRecordsActor()
{
    auto state = StateProjector::apply(streakguard::ChatState{}, trigger(1, 100));
    state = StateProjector::apply(state, manualReset(2, 400, "spam"));

    QCOMPARE(state.totalResetCount, static_cast<std::int64_t>(1));
    QVERIFY(state.lastResetActor.has_value());
    QCOMPARE(QString::fromStdString(state.lastResetActor->displayName), QStringLiteral("moderator"));
    QCOMPARE(QString::fromStdString(state.lastResetDetails.value("reason", "")),
             QStringLiteral("spam"));
    QCOMPARE(state.bestStreakSeconds, static_cast<std::int64_t>(300));
    QCOMPARE(streakguard::toEpochMillis(*state.bestStreakStart), static_cast<std::int64_t>(100000));
    QCOMPARE(streakguard::toEpochMillis(*state.bestStreakEnd), static_cast<std::int64_t>(400000));
}

void StateProjectorTests::testBestStreakOnlyGrowsOnLongerStreak()
{
    const std::vector<streakguard::Event> events{trigger(1, 0), trigger(2, 500), trigger(3, 600)};
    const auto state = StateProjector::fold(events);
    QCOMPARE(state.bestStreakSeconds, static_cast<std::int64_t>(500));
    QCOMPARE(streakguard::toEpochMillis(*state.bestStreakEnd), static_cast<std::int64_t>(500000));
    QCOMPARE(streakguard::toEpochMillis(*state.streakStart), static_cast<std::int64_t>(600000));
}

void StateProjectorTests::testUndoEventLeavesStateUntouched()
{
    const auto before = StateProjector::apply(streakguard::ChatState{}, trigger(1, 10));
    const auto after = StateProjector::apply(before, undo(2, 20, {1}));
    QVERIFY(before == after);
}

void StateProjectorTests::testFoldSkipsNullifiedEvents()
{
    const std::vector<streakguard::Event> events{
        trigger(1, 0),
        trigger(2, 1000),
        manualReset(3, 1100, "again"),
        undo(4, 1200, {3, 2}),
    };

    const auto nullified = StateProjector::nullifiedIds(events);
    QCOMPARE(nullified.size(), static_cast<std::size_t>(2));

    const auto state = StateProjector::fold(events);
    QCOMPARE(streakguard::toEpochMillis(*state.streakStart), static_cast<std::int64_t>(0));
    QCOMPARE(state.bestStreakSeconds, static_cast<std::int64_t>(0));
    QCOMPARE(state.totalResetCount, static_cast<std::int64_t>(0));
    QVERIFY(state == StateProjector::fold({trigger(1, 0)}));
}

void StateProjectorTests::testFoldUpperBound()
{
    const std::vector<streakguard::Event> events{trigger(1, 0), manualReset(2, 50, ""), trigger(3, 80)};
    const auto partial = StateProjector::fold(events, {}, 2);
    QCOMPARE(streakguard::toEpochMillis(*partial.streakStart), static_cast<std::int64_t>(50000));
    QCOMPARE(partial.totalResetCount, static_cast<std::int64_t>(1));
    QCOMPARE(*partial.lastResetEventId, static_cast<streakguard::EventId>(2));
}

QTEST_MAIN(StateProjectorTests)
#include "test_state_projector.moc"
