#include <gtest/gtest.h>
#include <managers/log_stream.hpp>
#include <managers/job_controller.hpp>
#include <managers/event_reporter.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include "fake_remote.hpp"

namespace fs = std::filesystem;
using std::chrono::milliseconds;

class LogStreamTest : public ::testing::Test {
protected:
    fs::path home_;
    std::string old_home_;
    bool had_home_ = false;

    FakeJobService api_;
    RetryPolicy policy_{fast_retry_config(3)};
    RecordingSleeper sleeper_;
    CancelToken cancel_;

    void SetUp() override {
        const char* home = std::getenv("HOME");
        had_home_ = home != nullptr;
        if (home) old_home_ = home;
        home_ = fs::temp_directory_path() / ("neuro_logs_test_" + std::to_string(::getpid()));
        fs::remove_all(home_);
        fs::create_directories(home_);
        ::setenv("HOME", home_.c_str(), 1);
    }

    void TearDown() override {
        if (had_home_) ::setenv("HOME", old_home_.c_str(), 1);
        else ::unsetenv("HOME");
        fs::remove_all(home_);
    }

    std::unique_ptr<LogStream> open(const std::string& id, LogStream::StatusFetch fetch,
                                    uint64_t since = 0, EventReporter* reporter = nullptr) {
        return std::make_unique<LogStream>(api_, policy_, id, std::move(fetch), milliseconds(250),
                                           sleeper_.make(cancel_), cancel_, reporter, since);
    }

    static LogStream::StatusFetch always(JobStatus status) {
        return [status] { return Result<JobStatus>::Ok(status); };
    }

    // Drains the stream; gaps are counted, any other error ends the read.
    struct Drained {
        std::vector<uint64_t> seqs;
        std::vector<std::string> data;
        int gaps = 0;
        std::optional<Error> error;
    };

    static Drained drain(LogStream& stream) {
        Drained out;
        for (int guard = 0; guard < 1000; ++guard) {
            auto r = stream.next();
            if (r.is_err()) {
                if (r.error.kind == ErrorKind::SequenceGap) {
                    out.gaps++;
                    continue;
                }
                out.error = r.error;
                return out;
            }
            if (!r.value) return out;
            out.seqs.push_back(r.value->seq);
            out.data.push_back(r.value->data);
        }
        ADD_FAILURE() << "stream did not finish";
        return out;
    }

    void add_logs(const std::string& id, uint64_t first, uint64_t last) {
        for (uint64_t s = first; s <= last; ++s) {
            api_.add_log(id, s, "line " + std::to_string(s) + "\n");
        }
    }
};

TEST_F(LogStreamTest, ReadsEverythingForFinishedJob) {
    std::string id = api_.add_job("succeeded");
    add_logs(id, 1, 3);
    api_.add_log(id, 4, "oops\n", "stderr");

    auto stream = open(id, always(JobStatus::Succeeded));
    std::vector<LogChunk> chunks;
    while (true) {
        auto r = stream->next();
        ASSERT_TRUE(r.is_ok()) << r.error.describe();
        if (!r.value) break;
        chunks.push_back(*r.value);
    }

    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].data, "line 1\n");
    EXPECT_EQ(chunks[3].stream, LogStreamKind::Stderr);
    EXPECT_EQ(stream->last_seq(), 4u);
    // One extra pass after the job was seen terminal
    EXPECT_EQ(api_.log_cursors(), (std::vector<std::string>{"0", "4"}));
    EXPECT_EQ(sleeper_.count(), 0u);
}

TEST_F(LogStreamTest, ReconnectDropsReplayedChunks) {
    std::string id = api_.add_job("succeeded");
    add_logs(id, 1, 6);
    api_.push_log_break(2);
    api_.set_log_replay_overlap(2);

    EventReporter events(64);
    auto stream = open(id, always(JobStatus::Succeeded), 0, &events);
    auto out = drain(*stream);

    ASSERT_FALSE(out.error.has_value()) << out.error->describe();
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(out.gaps, 0);
    EXPECT_EQ(stream->reconnects(), 1);
    EXPECT_GE(stream->duplicates_dropped(), 2u);
    EXPECT_EQ(api_.log_cursors()[1], "2");
    EXPECT_EQ(sleeper_.count(), 1u);

    events.close();
    auto ev = events.next();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::LogReconnect);
    EXPECT_EQ(ev->subject, id);
}

TEST_F(LogStreamTest, RecordsSplitAcrossChunks) {
    std::string id = api_.add_job("succeeded");
    add_logs(id, 1, 5);
    api_.set_split_records(true);
    api_.push_log_break(3);

    auto stream = open(id, always(JobStatus::Succeeded));
    auto out = drain(*stream);
    ASSERT_FALSE(out.error.has_value());
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(out.data[4], "line 5\n");
}

TEST_F(LogStreamTest, GapReportedThenStreamContinues) {
    std::string id = api_.add_job("failed");
    add_logs(id, 1, 2);
    add_logs(id, 5, 6);

    auto stream = open(id, always(JobStatus::Failed));
    auto a = stream->next();
    auto b = stream->next();
    auto gap = stream->next();
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    ASSERT_TRUE(gap.is_err());
    EXPECT_EQ(gap.error.kind, ErrorKind::SequenceGap);
    EXPECT_EQ(gap.error.subject, id);

    auto after = stream->next();
    ASSERT_TRUE(after.is_ok());
    ASSERT_TRUE(after.value.has_value());
    EXPECT_EQ(after.value->seq, 5u);

    auto rest = drain(*stream);
    EXPECT_EQ(rest.seqs, (std::vector<uint64_t>{6}));
    EXPECT_EQ(rest.gaps, 0);
}

TEST_F(LogStreamTest, WaitsForRunningJob) {
    std::string id = api_.add_job("running");
    add_logs(id, 1, 2);

    int polls = 0;
    auto fetch = [this, id, &polls]() {
        polls++;
        if (polls == 1) {
            // More output appears while the job keeps running
            api_.add_log(id, 3, "line 3\n");
            return Result<JobStatus>::Ok(JobStatus::Running);
        }
        return Result<JobStatus>::Ok(JobStatus::Succeeded);
    };

    auto stream = open(id, fetch);
    auto out = drain(*stream);
    ASSERT_FALSE(out.error.has_value());
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(polls, 2);
    EXPECT_EQ(sleeper_.delays(), (std::vector<milliseconds>{milliseconds(250)}));
}

TEST_F(LogStreamTest, ResumesFromCursor) {
    std::string id = api_.add_job("succeeded");
    add_logs(id, 1, 6);

    auto stream = open(id, always(JobStatus::Succeeded), 4);
    auto out = drain(*stream);
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{5, 6}));
    EXPECT_EQ(api_.log_cursors()[0], "4");
}

TEST_F(LogStreamTest, GivesUpAfterRepeatedFailures) {
    std::string id = api_.add_job("running");
    for (int i = 0; i < 3; ++i) api_.push_fault("STREAM", transient_error());

    auto stream = open(id, always(JobStatus::Running));
    auto r = stream->next();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::TransientNetwork);
    EXPECT_EQ(r.error.attempts, 3);
    EXPECT_EQ(sleeper_.count(), 2u);

    // Finished after a terminal error
    auto again = stream->next();
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value.has_value());
}

TEST_F(LogStreamTest, UnknownJobIsPermanent) {
    auto stream = open("job-nope", always(JobStatus::Running));
    auto r = stream->next();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Permanent);
    EXPECT_EQ(sleeper_.count(), 0u);
}

TEST_F(LogStreamTest, CancelStopsStream) {
    std::string id = api_.add_job("running");
    add_logs(id, 1, 2);
    cancel_.cancel();

    auto stream = open(id, always(JobStatus::Running));
    auto r = stream->next();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Cancelled);
}

TEST_F(LogStreamTest, StatusFailureEndsStream) {
    std::string id = api_.add_job("running");
    add_logs(id, 1, 1);
    auto fetch = [] {
        return Result<JobStatus>::Err(Error::make(ErrorKind::Permanent, "forbidden"));
    };

    auto stream = open(id, fetch);
    auto out = drain(*stream);
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{1}));
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::Permanent);
}

TEST_F(LogStreamTest, ControllerStreamUsesJobStatus) {
    ConcurrencyLimiter limiter(2);
    JobController jobs(api_, policy_, limiter, JobsConfig{});
    jobs.set_sleeper_factory([this](CancelToken cancel) { return sleeper_.make(cancel); });

    std::string id = api_.add_job("running", {"running", "succeeded"});
    add_logs(id, 1, 3);

    auto stream = jobs.stream_logs(id);
    auto out = drain(*stream);
    ASSERT_FALSE(out.error.has_value()) << out.error->describe();
    EXPECT_EQ(out.seqs, (std::vector<uint64_t>{1, 2, 3}));
    // First close saw the job running and waited one poll interval
    EXPECT_EQ(sleeper_.delays(), (std::vector<milliseconds>{milliseconds(5000)}));
}
