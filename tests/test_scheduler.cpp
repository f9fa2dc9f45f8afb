#include <catch2/catch.hpp>

#include "mtget/scheduler.hpp"
#include "mtget/transfer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <future>
#include <set>
#include <utility>

using namespace mtget;
using mtget_test::ScriptedExecutor;
using mtget_test::TempDir;

namespace {
class RecordingObserver : public SchedulerObserver {
public:
    void onDispatch(const Task& task, std::size_t active) override
    {
        dispatched.push_back(task.id);
        max_active = std::max(max_active, active);
    }

    void onResult(const TaskResult& result) override { results.push_back(result); }

    void onStateChange(TaskId id, TaskState state, int attempts) override
    {
        states[id].emplace_back(state, attempts);
    }

    std::vector<TaskId> dispatched;
    std::map<TaskId, std::vector<std::pair<TaskState, int>>> states;
    std::vector<TaskResult> results;
    std::size_t max_active = 0;
};

RunConfig test_config(int concurrency, int attempts)
{
    RunConfig config;
    config.concurrency = concurrency;
    config.retry.maxAttempts = attempts;
    config.retry.baseDelay = std::chrono::milliseconds(0);
    config.pollInterval = std::chrono::milliseconds(10);
    return config;
}

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds limit = std::chrono::seconds(5))
{
    const auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}
} // namespace

TEST_CASE("scheduler respects the concurrency cap")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 5);
    ScriptedExecutor exec{mtget_test::always_succeed, std::chrono::milliseconds(30)};
    RecordingObserver observer;

    Scheduler scheduler{test_config(2, 3), exec};
    scheduler.setObserver(&observer);
    const auto report = scheduler.run(tasks);

    CHECK(report.completed == 5);
    CHECK(report.failed == 0);
    CHECK(report.skipped == 0);
    CHECK(report.total == 5);
    CHECK(report.overallSuccess);
    CHECK(report.peakActive <= 2);
    CHECK(observer.max_active <= 2);
    CHECK(exec.peak() <= 2);
    CHECK(exec.calls() == 5);
    CHECK(scheduler.activeCount() == 0);
    CHECK(exitCodeFor(report) == ExitCode::Success);
}

TEST_CASE("scheduler with more slots than tasks runs them side by side")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 4);
    ScriptedExecutor exec{mtget_test::always_succeed, std::chrono::milliseconds(200)};

    Scheduler scheduler{test_config(10, 1), exec};
    const auto report = scheduler.run(tasks);

    CHECK(report.completed == 4);
    CHECK(report.peakActive == 4);
}

TEST_CASE("a task that always fails exhausts its attempts")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 1);
    ScriptedExecutor exec{mtget_test::always_fail};
    RecordingObserver observer;

    Scheduler scheduler{test_config(2, 3), exec};
    scheduler.setObserver(&observer);
    const auto report = scheduler.run(tasks);

    CHECK(exec.attempts_for(0) == 3);
    CHECK(report.failed == 1);
    CHECK(report.completed == 0);
    CHECK_FALSE(report.overallSuccess);
    CHECK(exitCodeFor(report) == ExitCode::Failure);

    REQUIRE(observer.results.size() == 1);
    CHECK(observer.results[0].outcome == Outcome::Failed);
    CHECK(observer.results[0].attempts == 3);
}

TEST_CASE("failures stay isolated to their own task")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 8);
    ScriptedExecutor exec{[](const Task& t, int) { return t.id % 3 != 0; }, std::chrono::milliseconds(5)};
    RecordingObserver observer;

    Scheduler scheduler{test_config(3, 2), exec};
    scheduler.setObserver(&observer);
    const auto report = scheduler.run(tasks);

    // ids 0, 3 and 6 fail
    CHECK(report.failed == 3);
    CHECK(report.completed == 5);
    CHECK(report.completed + report.failed + report.skipped == report.total);

    std::set<TaskId> seen;
    for (const auto& r : observer.results) {
        CHECK(seen.insert(r.id).second);
        if (r.outcome == Outcome::Failed) {
            CHECK(r.attempts == 2);
        }
    }
    CHECK(seen.size() == tasks.size());
}

TEST_CASE("dispatch order is FIFO")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 12);
    ScriptedExecutor exec{mtget_test::always_succeed, std::chrono::milliseconds(3)};
    RecordingObserver observer;

    Scheduler scheduler{test_config(3, 1), exec};
    scheduler.setObserver(&observer);
    (void) scheduler.run(tasks);

    REQUIRE(observer.dispatched.size() == tasks.size());
    for (std::size_t i = 0; i < observer.dispatched.size(); ++i) {
        CHECK(observer.dispatched[i] == static_cast<TaskId>(i));
    }
}

TEST_CASE("existing destinations are skipped without a worker")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 3);
    mtget_test::touch(tasks[1].destination);

    ScriptedExecutor exec{mtget_test::always_succeed};
    RecordingObserver observer;

    SECTION("resume disabled")
    {
        Scheduler scheduler{test_config(2, 3), exec};
        scheduler.setObserver(&observer);
        const auto report = scheduler.run(tasks);

        CHECK(report.skipped == 1);
        CHECK(report.completed == 2);
        CHECK(report.total == 3);
        CHECK(exec.attempts_for(1) == 0);
        CHECK(std::find(observer.dispatched.begin(), observer.dispatched.end(), 1) == observer.dispatched.end());
        CHECK(exitCodeFor(report) == ExitCode::Success);
    }

    SECTION("resume enabled hands the file to a worker")
    {
        auto config = test_config(2, 3);
        config.transfer.resume = true;
        Scheduler scheduler{config, exec};
        const auto report = scheduler.run(tasks);

        CHECK(report.skipped == 0);
        CHECK(report.completed == 3);
        CHECK(exec.attempts_for(1) == 1);
    }
}

TEST_CASE("rerunning over finished destinations is a no-op")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 6);
    for (const auto& t : tasks) {
        mtget_test::touch(t.destination);
    }

    ScriptedExecutor exec{mtget_test::always_succeed};
    Scheduler scheduler{test_config(4, 3), exec};
    const auto report = scheduler.run(tasks);

    CHECK(report.skipped == 6);
    CHECK(report.completed == 0);
    CHECK(report.failed == 0);
    CHECK(report.peakActive == 0);
    CHECK(exec.started() == 0);
}

TEST_CASE("an interrupt cancels active workers and stops dispatch")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 10);
    ScriptedExecutor exec{mtget_test::always_succeed, std::chrono::milliseconds(0), true};
    RecordingObserver observer;

    Scheduler scheduler{test_config(3, 3), exec};
    scheduler.setObserver(&observer);

    SECTION("requestStop from another thread")
    {
        auto running = std::async(std::launch::async, [&] { return scheduler.run(tasks); });
        REQUIRE(wait_for([&] { return exec.in_flight() == 3; }));

        scheduler.requestStop();
        REQUIRE(running.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        const auto report = running.get();

        CHECK(report.interrupted);
        CHECK(report.failed == 3);
        CHECK(report.notDispatched == 7);
        CHECK(report.completed + report.failed + report.skipped + report.notDispatched == report.total);
        CHECK(exitCodeFor(report) == ExitCode::Interrupted);
        CHECK(exec.in_flight() == 0);
        CHECK(observer.dispatched.size() == 3);
        for (const auto& r : observer.results) {
            CHECK(r.interrupted);
        }
    }

    SECTION("stop predicate bridges an external flag")
    {
        std::atomic<bool> signalled{false};
        scheduler.setStopPredicate([&signalled] { return signalled.load(); });

        auto running = std::async(std::launch::async, [&] { return scheduler.run(tasks); });
        REQUIRE(wait_for([&] { return exec.in_flight() == 3; }));

        signalled = true;
        REQUIRE(running.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        const auto report = running.get();

        CHECK(report.interrupted);
        CHECK(scheduler.stopRequested());
        CHECK(exitCodeFor(report) == ExitCode::Interrupted);
        CHECK(exec.in_flight() == 0);
    }
}

TEST_CASE("task state transitions")
{
    CHECK(canTransition(TaskState::Pending, TaskState::Dispatched));
    CHECK(canTransition(TaskState::Pending, TaskState::Skipped));
    CHECK(canTransition(TaskState::Dispatched, TaskState::Retrying));
    CHECK(canTransition(TaskState::Retrying, TaskState::Retrying));
    CHECK(canTransition(TaskState::Retrying, TaskState::Completed));
    CHECK(canTransition(TaskState::Dispatched, TaskState::Failed));

    CHECK_FALSE(canTransition(TaskState::Pending, TaskState::Retrying));
    CHECK_FALSE(canTransition(TaskState::Dispatched, TaskState::Skipped));
    CHECK_FALSE(canTransition(TaskState::Completed, TaskState::Retrying));
    CHECK_FALSE(canTransition(TaskState::Failed, TaskState::Dispatched));
    CHECK_FALSE(canTransition(TaskState::Skipped, TaskState::Dispatched));

    CHECK(isTerminal(TaskState::Skipped));
    CHECK_FALSE(isTerminal(TaskState::Retrying));
}

TEST_CASE("retries move the worker handle through its states")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 3);
    mtget_test::touch(tasks[2].destination);

    // task 0 recovers on its third attempt, task 1 never does
    ScriptedExecutor exec{[](const Task& t, int attempt) { return t.id == 0 && attempt == 3; }};
    RecordingObserver observer;

    Scheduler scheduler{test_config(2, 3), exec};
    scheduler.setObserver(&observer);
    const auto report = scheduler.run(tasks);

    CHECK(report.completed == 1);
    CHECK(report.failed == 1);
    CHECK(report.skipped == 1);

    using Step = std::pair<TaskState, int>;
    const std::vector<Step> recovered{
        {TaskState::Dispatched, 0}, {TaskState::Retrying, 1}, {TaskState::Retrying, 2}, {TaskState::Completed, 3}};
    const std::vector<Step> exhausted{
        {TaskState::Dispatched, 0}, {TaskState::Retrying, 1}, {TaskState::Retrying, 2}, {TaskState::Failed, 3}};
    const std::vector<Step> skipped{{TaskState::Skipped, 0}};

    CHECK(observer.states[0] == recovered);
    CHECK(observer.states[1] == exhausted);
    CHECK(observer.states[2] == skipped);

    for (const auto& entry : observer.states) {
        TaskState previous = TaskState::Pending;
        for (const auto& step : entry.second) {
            CHECK(canTransition(previous, step.first));
            previous = step.first;
        }
        CHECK(isTerminal(previous));
    }
}

TEST_CASE("an interrupt terminates real transfer processes")
{
    TempDir tmp;
    auto tasks = mtget_test::make_tasks(tmp.path(), 4);

    auto pid_file = [](const Task& t) { return t.destination.string() + ".pid"; };
    CommandExecutor exec{[&pid_file](const Task& t, const TransferOptions&) {
                             return std::vector<std::string>{
                                 "sh", "-c", "echo $$ > '" + pid_file(t) + "'; exec sleep 30"};
                         },
                         std::chrono::milliseconds(300),
                         std::chrono::milliseconds(10)};

    auto config = test_config(2, 3);
    config.transfer.timeout = std::chrono::seconds(60);
    Scheduler scheduler{config, exec};

    std::atomic<bool> signalled{false};
    scheduler.setStopPredicate([&signalled] { return signalled.load(); });

    auto running = std::async(std::launch::async, [&] { return scheduler.run(tasks); });
    REQUIRE(wait_for([&] {
        return std::filesystem::exists(pid_file(tasks[0])) && std::filesystem::exists(pid_file(tasks[1]));
    }));
    // let both shells reach the exec
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    signalled = true;
    REQUIRE(running.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    const auto report = running.get();

    CHECK(report.interrupted);
    CHECK(report.failed == 2);
    CHECK(report.notDispatched == 2);
    CHECK(exitCodeFor(report) == ExitCode::Interrupted);
    CHECK_FALSE(std::filesystem::exists(pid_file(tasks[2])));
    CHECK_FALSE(std::filesystem::exists(pid_file(tasks[3])));

    for (int i = 0; i < 2; ++i) {
        std::ifstream in(pid_file(tasks[i]));
        long pid = 0;
        in >> pid;
        REQUIRE(pid > 0);
        const int rc = ::kill(static_cast<pid_t>(pid), 0);
        const int err = errno;
        CHECK(rc == -1);
        CHECK(err == ESRCH);
    }
}
