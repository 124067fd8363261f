#include <QtTest/QtTest>

#include "planner/engine/PriorityScorer.hpp"

using namespace planner;
using engine::UrgencyTier;

namespace {

const QDate Today(2025, 8, 3);

data::TaskItem makeTask(data::PriorityTier tier, int minutes, const QDate &deadline = QDate())
{
    data::TaskItem task;
    task.title = "Task";
    task.priority = tier;
    task.estimatedMinutes = minutes;
    task.deadline = deadline;
    return task;
}

} // namespace

class PriorityScorerTest : public QObject
{
    Q_OBJECT

private slots:
    void urgencyTiers_data();
    void urgencyTiers();
    void urgencyBoostsStrictlyOrdered();
    void priorityTierDominatesUrgency();
    void urgencyDominatesDuration();
    void shorterTaskScoresHigher();
    void unparseableDeadlineCountsAsNone();
    void repeatedScoringIsIdentical();
};

void PriorityScorerTest::urgencyTiers_data()
{
    QTest::addColumn<int>("daysLeft");
    QTest::addColumn<int>("expected");

    QTest::newRow("overdue by a week") << -7 << int(UrgencyTier::Overdue);
    QTest::newRow("overdue by a day") << -1 << int(UrgencyTier::Overdue);
    QTest::newRow("today") << 0 << int(UrgencyTier::DueToday);
    QTest::newRow("tomorrow") << 1 << int(UrgencyTier::DueSoon);
    QTest::newRow("three days") << 3 << int(UrgencyTier::DueSoon);
    QTest::newRow("four days") << 4 << int(UrgencyTier::DueThisWeek);
    QTest::newRow("one week") << 7 << int(UrgencyTier::DueThisWeek);
    QTest::newRow("eight days") << 8 << int(UrgencyTier::None);
    QTest::newRow("next month") << 30 << int(UrgencyTier::None);
}

void PriorityScorerTest::urgencyTiers()
{
    QFETCH(int, daysLeft);
    QFETCH(int, expected);

    QCOMPARE(int(engine::urgencyTier(Today.addDays(daysLeft), Today)), expected);
    QCOMPARE(engine::urgencyTier(QDate(), Today), UrgencyTier::None);
}

void PriorityScorerTest::urgencyBoostsStrictlyOrdered()
{
    QVERIFY(engine::urgencyBoost(UrgencyTier::Overdue) > engine::urgencyBoost(UrgencyTier::DueToday));
    QVERIFY(engine::urgencyBoost(UrgencyTier::DueToday) > engine::urgencyBoost(UrgencyTier::DueSoon));
    QVERIFY(engine::urgencyBoost(UrgencyTier::DueSoon) > engine::urgencyBoost(UrgencyTier::DueThisWeek));
    QVERIFY(engine::urgencyBoost(UrgencyTier::DueThisWeek) > engine::urgencyBoost(UrgencyTier::None));
    QCOMPARE(engine::urgencyBoost(UrgencyTier::None), 0.0);
}

void PriorityScorerTest::priorityTierDominatesUrgency()
{
    // A high-priority task due in a month still outranks an overdue low-priority one.
    const auto highLater = makeTask(data::PriorityTier::High, 480, Today.addDays(30));
    const auto lowOverdue = makeTask(data::PriorityTier::Low, 1, Today.addDays(-10));
    QVERIFY(engine::priorityScore(highLater, Today) > engine::priorityScore(lowOverdue, Today));

    const auto mediumUndated = makeTask(data::PriorityTier::Medium, 480);
    QVERIFY(engine::priorityScore(mediumUndated, Today) > engine::priorityScore(lowOverdue, Today));

    const auto highUndated = makeTask(data::PriorityTier::High, 480);
    const auto mediumOverdue = makeTask(data::PriorityTier::Medium, 1, Today.addDays(-1));
    QVERIFY(engine::priorityScore(highUndated, Today) > engine::priorityScore(mediumOverdue, Today));

    QVERIFY(engine::OverdueBoost + engine::MaxDurationBonus < engine::MediumPriorityBase - engine::LowPriorityBase);
}

void PriorityScorerTest::urgencyDominatesDuration()
{
    QVERIFY(engine::MaxDurationBonus < engine::DueThisWeekBoost);

    const int durations[] = { 1, 15, 60, 240, 480, 1000 };
    for (const int shortMinutes : durations) {
        for (const int longMinutes : durations) {
            const auto dueThisWeek = makeTask(data::PriorityTier::Low, longMinutes, Today.addDays(6));
            const auto undated = makeTask(data::PriorityTier::Low, shortMinutes);
            QVERIFY(engine::priorityScore(dueThisWeek, Today) > engine::priorityScore(undated, Today));

            const auto overdue = makeTask(data::PriorityTier::Medium, longMinutes, Today.addDays(-2));
            const auto dueToday = makeTask(data::PriorityTier::Medium, shortMinutes, Today);
            QVERIFY(engine::priorityScore(overdue, Today) > engine::priorityScore(dueToday, Today));
        }
    }
}

void PriorityScorerTest::shorterTaskScoresHigher()
{
    const auto quick = makeTask(data::PriorityTier::Medium, 15);
    const auto slow = makeTask(data::PriorityTier::Medium, 120);
    QVERIFY(engine::priorityScore(quick, Today) > engine::priorityScore(slow, Today));
    QVERIFY(engine::durationBonus(1) < engine::MaxDurationBonus);
    QCOMPARE(engine::durationBonus(engine::DurationBonusHorizonMinutes), 0.0);
    QCOMPARE(engine::durationBonus(5000), 0.0);
}

void PriorityScorerTest::unparseableDeadlineCountsAsNone()
{
    const QDate garbage = QDate::fromString(QStringLiteral("2025-02-31"), Qt::ISODate);
    QVERIFY(!garbage.isValid());

    const auto malformed = makeTask(data::PriorityTier::High, 30, garbage);
    const auto undated = makeTask(data::PriorityTier::High, 30);
    QCOMPARE(engine::priorityScore(malformed, Today), engine::priorityScore(undated, Today));
}

void PriorityScorerTest::repeatedScoringIsIdentical()
{
    const auto task = makeTask(data::PriorityTier::Medium, 37, Today.addDays(2));
    const double first = engine::priorityScore(task, Today);
    for (int i = 0; i < 10; ++i) {
        QVERIFY(engine::priorityScore(task, Today) == first);
    }
}

QTEST_GUILESS_MAIN(PriorityScorerTest)
#include "PriorityScorerTest.moc"
