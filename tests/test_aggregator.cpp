#include <catch2/catch.hpp>

#include "mtget/aggregator.hpp"

using namespace mtget;

namespace {
TaskResult result_of(TaskId id, Outcome outcome)
{
    TaskResult r;
    r.id = id;
    r.outcome = outcome;
    r.attempts = outcome == Outcome::Skipped ? 0 : 1;
    return r;
}
} // namespace

TEST_CASE("aggregator tallies")
{
    Aggregator agg{5};

    SECTION("counts every outcome and sums to the total")
    {
        agg.record(result_of(0, Outcome::Completed));
        agg.record(result_of(1, Outcome::Skipped));
        agg.record(result_of(2, Outcome::Failed));
        agg.record(result_of(3, Outcome::Completed));
        agg.record(result_of(4, Outcome::Completed));

        const auto report = agg.report();
        CHECK(report.completed == 3);
        CHECK(report.failed == 1);
        CHECK(report.skipped == 1);
        CHECK(report.total == 5);
        CHECK(report.completed + report.failed + report.skipped == report.total);
        CHECK_FALSE(report.overallSuccess);
        CHECK(exitCodeFor(report) == ExitCode::Failure);
    }

    SECTION("skips alone do not fail the run")
    {
        for (TaskId i = 0; i < 5; ++i) {
            agg.record(result_of(i, Outcome::Skipped));
        }
        const auto report = agg.report();
        CHECK(report.skipped == 5);
        CHECK(report.overallSuccess);
        CHECK(exitCodeFor(report) == ExitCode::Success);
    }

    SECTION("order of arrival does not change the counts")
    {
        Aggregator other{5};
        const Outcome outcomes[] = {Outcome::Failed, Outcome::Completed, Outcome::Skipped,
                                    Outcome::Completed, Outcome::Failed};
        for (TaskId i = 0; i < 5; ++i) {
            agg.record(result_of(i, outcomes[i]));
            other.record(result_of(4 - i, outcomes[4 - i]));
        }
        const auto a = agg.report();
        const auto b = other.report();
        CHECK(a.completed == b.completed);
        CHECK(a.failed == b.failed);
        CHECK(a.skipped == b.skipped);
    }

    SECTION("an interrupt maps to exit code 130")
    {
        agg.record(result_of(0, Outcome::Completed));
        agg.markNotDispatched(4);
        agg.markInterrupted();

        const auto report = agg.report();
        CHECK(report.interrupted);
        CHECK(report.notDispatched == 4);
        CHECK(report.completed + report.failed + report.skipped + report.notDispatched == report.total);
        CHECK(exitCodeFor(report) == ExitCode::Interrupted);
    }
}
