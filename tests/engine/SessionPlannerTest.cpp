#include <QtTest/QtTest>

#include "planner/engine/BreakSuggestionProvider.hpp"
#include "planner/engine/SessionPlanner.hpp"

#include <limits>

using namespace planner;
using data::SessionKind;

namespace {

const QDate Today(2025, 8, 3);

data::TaskItem makeTask(const QString &title, int minutes, data::PriorityTier tier = data::PriorityTier::Medium)
{
    data::TaskItem task;
    task.id = title;
    task.title = title;
    task.estimatedMinutes = minutes;
    task.priority = tier;
    return task;
}

} // namespace

class SessionPlannerTest : public QObject
{
    Q_OBJECT

private slots:
    void longTaskCycle();
    void noBreakAfterFinalSession();
    void breaksBetweenTasks();
    void followsPriorityOrder();
    void nothingToPlan();
    void suggestionsComeFromProvider();
    void repeatedPlansAreIdentical();
    void randomSuggestionsStayInList();
    void largestEstimateEndsWithFocus();
};

void SessionPlannerTest::longTaskCycle()
{
    const auto sessions = engine::SessionPlanner(Today).plan({ makeTask("Thesis", 120) });

    const QList<SessionKind> expectedKinds = {
        SessionKind::Focus, SessionKind::ShortBreak, SessionKind::Focus, SessionKind::ShortBreak,
        SessionKind::Focus, SessionKind::ShortBreak, SessionKind::Focus, SessionKind::LongBreak,
        SessionKind::Focus,
    };
    const QList<int> expectedMinutes = { 25, 5, 25, 5, 25, 5, 25, 15, 20 };

    QCOMPARE(sessions.size(), static_cast<size_t>(expectedKinds.size()));
    int focusSeen = 0;
    for (int i = 0; i < expectedKinds.size(); ++i) {
        const auto &session = sessions.at(static_cast<size_t>(i));
        QCOMPARE(session.kind, expectedKinds.at(i));
        QCOMPARE(session.durationMinutes, expectedMinutes.at(i));
        if (!session.isBreak()) {
            ++focusSeen;
            QCOMPARE(session.sessionIndex, focusSeen);
            QCOMPARE(session.sessionCount, 5);
            QCOMPARE(session.focusNumber, focusSeen);
            QCOMPARE(session.task.title, QStringLiteral("Thesis"));
        }
    }
}

void SessionPlannerTest::noBreakAfterFinalSession()
{
    const auto sessions = engine::SessionPlanner(Today).plan({ makeTask("Short", 25) });

    QCOMPARE(sessions.size(), static_cast<size_t>(1));
    QCOMPARE(sessions.front().kind, SessionKind::Focus);
    QCOMPARE(sessions.front().durationMinutes, 25);
}

void SessionPlannerTest::breaksBetweenTasks()
{
    const auto sessions = engine::SessionPlanner(Today).plan({ makeTask("One", 20), makeTask("Two", 10) });

    QCOMPARE(sessions.size(), static_cast<size_t>(3));
    QCOMPARE(sessions.at(1).kind, SessionKind::ShortBreak);
    QVERIFY(!sessions.back().isBreak());
}

void SessionPlannerTest::followsPriorityOrder()
{
    const auto sessions = engine::SessionPlanner(Today).plan({
        makeTask("Chores", 30, data::PriorityTier::Low),
        makeTask("Deadline", 30, data::PriorityTier::High),
    });

    QVERIFY(!sessions.empty());
    QCOMPARE(sessions.front().task.title, QStringLiteral("Deadline"));
    QCOMPARE(sessions.back().task.title, QStringLiteral("Chores"));
}

void SessionPlannerTest::nothingToPlan()
{
    QVERIFY(engine::SessionPlanner(Today).plan({}).empty());

    engine::SessionPolicy policy;
    policy.focusMinutes = 0;
    QVERIFY(engine::SessionPlanner(Today, policy).plan({ makeTask("Any", 30) }).empty());
    policy.focusMinutes = -25;
    QVERIFY(engine::SessionPlanner(Today, policy).plan({ makeTask("Any", 30) }).empty());
}

void SessionPlannerTest::suggestionsComeFromProvider()
{
    engine::CyclingBreakSuggestions suggestions;
    const auto sessions = engine::SessionPlanner(Today, engine::SessionPolicy(), &suggestions)
                              .plan({ makeTask("Thesis", 120) });

    QCOMPARE(sessions.at(1).suggestion, engine::shortBreakSuggestions().first());
    QCOMPARE(sessions.at(3).suggestion, engine::shortBreakSuggestions().at(1));
    QCOMPARE(sessions.at(7).suggestion, engine::longBreakSuggestions().first());
    QVERIFY(sessions.at(0).suggestion.isEmpty());

    const auto plain = engine::SessionPlanner(Today).plan({ makeTask("Thesis", 120) });
    QVERIFY(plain.at(1).suggestion.isEmpty());
}

void SessionPlannerTest::repeatedPlansAreIdentical()
{
    const engine::CyclingBreakSuggestions suggestions {};
    const engine::SessionPlanner planner(Today, engine::SessionPolicy(), &suggestions);

    const auto first = planner.plan({ makeTask("Thesis", 120) });
    const auto second = planner.plan({ makeTask("Thesis", 120) });
    QCOMPARE(second.size(), first.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        QCOMPARE(second.at(i).suggestion, first.at(i).suggestion);
    }
}

void SessionPlannerTest::randomSuggestionsStayInList()
{
    const engine::RandomBreakSuggestions first(7);
    const engine::RandomBreakSuggestions second(7);
    QCOMPARE(first.seed(), 7u);
    for (int i = 0; i < 20; ++i) {
        const QString text = first.suggestion(SessionKind::ShortBreak, 5, i);
        QVERIFY(engine::shortBreakSuggestions().contains(text));
        QCOMPARE(second.suggestion(SessionKind::ShortBreak, 5, i), text);
        QCOMPARE(first.suggestion(SessionKind::ShortBreak, 5, i), text);
    }
    QVERIFY(engine::longBreakSuggestions().contains(first.suggestion(SessionKind::LongBreak, 15, 0)));
}

void SessionPlannerTest::largestEstimateEndsWithFocus()
{
    const int largest = std::numeric_limits<int>::max();
    engine::SessionPolicy policy;
    policy.focusMinutes = 1 << 30;

    const auto sessions = engine::SessionPlanner(Today, policy)
                              .plan({ makeTask("First", largest), makeTask("Second", largest) });

    QCOMPARE(sessions.size(), static_cast<size_t>(7));
    QCOMPARE(sessions.at(0).durationMinutes, 1 << 30);
    QCOMPARE(sessions.at(2).durationMinutes, largest - (1 << 30));
    QCOMPARE(sessions.at(0).sessionCount, 2);
    QCOMPARE(sessions.back().kind, SessionKind::Focus);
    QCOMPARE(sessions.back().focusNumber, 4);
    QVERIFY(!sessions.back().isBreak());
}

QTEST_GUILESS_MAIN(SessionPlannerTest)
#include "SessionPlannerTest.moc"
