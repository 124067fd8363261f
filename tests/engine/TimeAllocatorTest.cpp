#include <QtTest/QtTest>

#include "planner/engine/TimeAllocator.hpp"

using namespace planner;

namespace {

std::vector<data::TaskItem> tasksOf(std::initializer_list<int> minutes)
{
    std::vector<data::TaskItem> tasks;
    int index = 0;
    for (const int m : minutes) {
        data::TaskItem task;
        task.id = QString::number(++index);
        task.title = QStringLiteral("T%1").arg(index);
        task.estimatedMinutes = m;
        tasks.push_back(task);
    }
    return tasks;
}

QList<int> allocatedMinutes(const data::Allocation &allocation)
{
    QList<int> result;
    for (const auto &entry : allocation.scheduled) {
        result << entry.allocatedMinutes;
    }
    return result;
}

} // namespace

class TimeAllocatorTest : public QObject
{
    Q_OBJECT

private slots:
    void nothingToAllocate();
    void everythingFits();
    void partialAllocationForFirstMisfit();
    void remainderBelowChunkIsLeftUnused();
    void remainderAtLeastChunkIsUsed();
    void skippedTaskLetsShorterOneIn();
    void singleTaskLargerThanBudget();
    void minimumChunkIsConfigurable();
    void scheduleOrderFollowsSequence();
    void leftoverBudgetOnlyWhenNothingWaits();
    void breakRecommendation_data();
    void breakRecommendation();
};

void TimeAllocatorTest::nothingToAllocate()
{
    const engine::TimeAllocator allocator;

    auto allocation = allocator.allocate(tasksOf({ 30, 45 }), 0);
    QVERIFY(allocation.scheduled.empty());
    QCOMPARE(allocation.unscheduled.size(), static_cast<size_t>(2));

    allocation = allocator.allocate(tasksOf({ 30 }), -10);
    QVERIFY(allocation.scheduled.empty());

    allocation = allocator.allocate({}, 120);
    QVERIFY(allocation.scheduled.empty());
    QVERIFY(allocation.unscheduled.empty());
    QCOMPARE(allocation.totalAllocatedMinutes(), 0);
}

void TimeAllocatorTest::everythingFits()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 30, 45, 15 }), 120);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 30, 45, 15 }));
    QVERIFY(allocation.unscheduled.empty());
    QCOMPARE(allocation.totalAllocatedMinutes(), 90);
    for (const auto &entry : allocation.scheduled) {
        QVERIFY(!entry.partial);
        QCOMPARE(entry.remainingMinutes, 0);
        QCOMPARE(entry.completionPercentage, 100.0);
    }
}

void TimeAllocatorTest::partialAllocationForFirstMisfit()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 60, 50 }), 90);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 60, 30 }));
    const auto &partial = allocation.scheduled.at(1);
    QVERIFY(partial.partial);
    QCOMPARE(partial.remainingMinutes, 20);
    QCOMPARE(partial.completionPercentage, 60.0);
    QVERIFY(allocation.unscheduled.empty());
}

void TimeAllocatorTest::remainderBelowChunkIsLeftUnused()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 80, 30 }), 90);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 80 }));
    QCOMPARE(allocation.unscheduled.size(), static_cast<size_t>(1));
    QCOMPARE(allocation.unscheduled.front().title, QStringLiteral("T2"));
}

void TimeAllocatorTest::remainderAtLeastChunkIsUsed()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 70, 30 }), 90);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 70, 20 }));
    QVERIFY(allocation.scheduled.back().partial);
    QCOMPARE(allocation.totalAllocatedMinutes(), 90);
}

void TimeAllocatorTest::skippedTaskLetsShorterOneIn()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 80, 30, 10 }), 90);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 80, 10 }));
    QCOMPARE(allocation.scheduled.back().task.title, QStringLiteral("T3"));
    QCOMPARE(allocation.unscheduled.size(), static_cast<size_t>(1));
    QCOMPARE(allocation.unscheduled.front().title, QStringLiteral("T2"));
}

void TimeAllocatorTest::singleTaskLargerThanBudget()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 200 }), 90);

    QCOMPARE(allocatedMinutes(allocation), QList<int>({ 90 }));
    QCOMPARE(allocation.scheduled.front().remainingMinutes, 110);
    QCOMPARE(allocation.scheduled.front().completionPercentage, 45.0);
}

void TimeAllocatorTest::minimumChunkIsConfigurable()
{
    const auto tasks = tasksOf({ 80, 30 });

    QCOMPARE(allocatedMinutes(engine::TimeAllocator().allocate(tasks, 100)), QList<int>({ 80, 20 }));
    QCOMPARE(allocatedMinutes(engine::TimeAllocator(30).allocate(tasks, 100)), QList<int>({ 80 }));
    QCOMPARE(engine::TimeAllocator(0).minimumChunkMinutes(), 1);
}

void TimeAllocatorTest::scheduleOrderFollowsSequence()
{
    const auto allocation = engine::TimeAllocator().allocate(tasksOf({ 20, 20, 20 }), 60);

    for (std::size_t i = 0; i < allocation.scheduled.size(); ++i) {
        QCOMPARE(allocation.scheduled[i].scheduleOrder, static_cast<int>(i) + 1);
    }
    QVERIFY(allocation.totalAllocatedMinutes() <= 60);
}

void TimeAllocatorTest::leftoverBudgetOnlyWhenNothingWaits()
{
    const QList<std::vector<data::TaskItem>> taskSets = {
        tasksOf({ 80, 30 }),       tasksOf({ 70, 30 }),           tasksOf({ 80, 30, 10 }),
        tasksOf({ 200, 40, 16 }),  tasksOf({ 50, 50, 50, 14 }),   tasksOf({ 10, 90, 20, 5, 60 }),
        tasksOf({ 15, 15, 15 }),   tasksOf({ 120, 100, 80, 14 }),
    };
    const QList<int> budgets = { 1, 14, 15, 16, 29, 45, 90, 100, 135, 240 };

    for (const auto &tasks : taskSets) {
        for (const int budget : budgets) {
            const engine::TimeAllocator allocator;
            const auto allocation = allocator.allocate(tasks, budget);
            const int left = budget - allocation.totalAllocatedMinutes();
            QVERIFY(left >= 0);
            QCOMPARE(allocation.scheduled.size() + allocation.unscheduled.size(), tasks.size());
            if (allocation.unscheduled.empty()) {
                continue;
            }
            bool partial = false;
            for (const auto &entry : allocation.scheduled) {
                partial = partial || entry.partial;
            }
            QVERIFY2(partial || left < allocator.minimumChunkMinutes(),
                     qPrintable(QStringLiteral("budget %1 left %2 unused").arg(budget).arg(left)));
        }
    }
}

void TimeAllocatorTest::breakRecommendation_data()
{
    QTest::addColumn<int>("minutes");
    QTest::addColumn<int>("expected");

    QTest::newRow("short") << 20 << 5;
    QTest::newRow("pomodoro") << 25 << 5;
    QTest::newRow("half hour") << 30 << 10;
    QTest::newRow("hour") << 60 << 10;
    QTest::newRow("ninety") << 90 << 15;
    QTest::newRow("long") << 120 << 20;
}

void TimeAllocatorTest::breakRecommendation()
{
    QFETCH(int, minutes);
    QFETCH(int, expected);

    QCOMPARE(engine::recommendedBreakMinutes(minutes), expected);
}

QTEST_GUILESS_MAIN(TimeAllocatorTest)
#include "TimeAllocatorTest.moc"
