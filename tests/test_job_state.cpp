#include "job_state.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <thread>

int main()
{
    // Lifecycle transitions
    {
        JobState state;
        check(state.status() == JobStatus::Idle, "new job is Idle");
        check(!state.pause(), "pause is ignored while Idle");
        check(!state.resume(), "resume is ignored while Idle");

        check(state.beginTransfer(3), "transfer begins from Idle");
        check(state.status() == JobStatus::Downloading, "status is Downloading after begin");
        check(state.progress().size() == 3, "one progress slot per part");
        check(!state.beginTransfer(2), "a second begin is refused");

        check(state.pause(), "pause from Downloading");
        check(!state.pause(), "pause is idempotent");
        check(state.status() == JobStatus::Paused, "status is Paused");
        check(state.resume(), "resume from Paused");
        check(!state.resume(), "resume is idempotent");
        check(state.status() == JobStatus::Downloading, "status is Downloading again");

        check(state.complete(), "complete from Downloading");
        check(state.status() == JobStatus::Done, "status is Done");
        state.fail("late failure");
        check(state.status() == JobStatus::Done, "Done is terminal");
        check(!state.firstFailure(), "no failure recorded after Done");
    }

    // Failures
    {
        JobState state;
        state.beginTransfer(2);
        state.pause();
        state.fail("part 1 failed");
        state.fail("part 0 failed");
        check(state.status() == JobStatus::Error, "fail moves a paused job to Error");
        check(state.firstFailure() == std::optional<std::string>("part 1 failed"), "first failure wins");
        check(!state.resume(), "resume does not leave Error");
        check(!state.complete(), "complete does not leave Error");
    }

    // Progress accounting
    {
        JobState state;
        state.beginTransfer(2);

        double total = state.recordChunk(0, 1000, 0.0);
        check(state.progress()[0].speed == 0.0, "zero active time yields zero speed");
        check(total == 0.0, "aggregate speed is zero on the first tick");

        state.recordChunk(0, 1000, 2.0);
        total = state.recordChunk(1, 500, 1.0);
        auto progress = state.progress();
        check(progress[0].bytesDownloaded == 2000, "bytes accumulate per part");
        check(progress[0].speed == 1000.0, "speed is bytes over active seconds");
        check(progress[1].speed == 500.0, "each part has its own speed");
        check(total == 1500.0, "aggregate speed sums all parts");

        JobSnapshot snapshot = state.snapshot();
        check(snapshot.totalBytes() == 2500, "snapshot totals bytes");
        check(snapshot.totalSpeed() == 1500.0, "snapshot totals speed");
        check(snapshot.status == JobStatus::Downloading, "snapshot carries the status");

        bool threw = throwsAs<std::out_of_range>([&state]()
                                                 { state.recordChunk(5, 1, 1.0); });
        check(threw, "unknown part index is rejected");
    }

    // Concurrent updates from several threads
    {
        JobState state;
        state.beginTransfer(4);
        std::vector<std::thread> workers;
        for (size_t part = 0; part < 4; ++part)
        {
            workers.emplace_back([&state, part]()
                                 {
                for (int i = 0; i < 10000; ++i)
                {
                    state.recordChunk(part, 1, 1.0);
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }
        check(state.snapshot().totalBytes() == 40000, "no update is lost under concurrency");
    }

    check(std::string(toString(JobStatus::Paused)) == "paused", "status names are readable");

    return finishTests("job state");
}
