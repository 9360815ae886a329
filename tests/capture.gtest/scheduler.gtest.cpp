#include "capture/capture_scheduler.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace gtest
{

    class SchedulerTest : public ::testing::Test
    {
    protected:
        fakes::TempDir dir;
        ErrorStore errors{dir.file("errors.db")};
        shared_ptr<FrameSlot> slot = make_shared<FrameSlot>();
        fakes::FakeFrameSource *source = nullptr;
        unique_ptr<CaptureScheduler> scheduler;

        void SetUp() override
        {
            ASSERT_TRUE(errors.initialize());
            rebuild(50, 1000);
        }

        void rebuild(int fps, int join_timeout_ms)
        {
            scheduler.reset();

            auto fake = make_unique<fakes::FakeFrameSource>();
            source = fake.get();

            CaptureConfig config;
            config.fps = fps;
            config.join_timeout_ms = join_timeout_ms;
            scheduler = make_unique<CaptureScheduler>(move(fake), slot, errors, config);
        }

        //! Waits until the source has seen at least n reads.
        bool waitForReads(int n, std::chrono::milliseconds limit = std::chrono::seconds(3))
        {
            auto deadline = std::chrono::steady_clock::now() + limit;
            while (source->reads < n && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return source->reads >= n;
        }

        static vector<double> gapsMs(const vector<std::chrono::steady_clock::time_point> &times)
        {
            vector<double> gaps;
            for (size_t i = 1; i < times.size(); i++)
                gaps.push_back(std::chrono::duration<double, std::milli>(times[i] - times[i - 1]).count());
            return gaps;
        }

        vector<ErrorRecord> captureErrors(ErrorSeverity severity)
        {
            ErrorFilter filter;
            filter.category = ErrorCategory::CAPTURE;
            filter.severity = severity;
            return errors.getErrors(filter);
        }

        void fail(int times)
        {
            for (int i = 0; i < times; i++)
            {
                source->script.push_back(false);
                EXPECT_FALSE(scheduler->captureOnce());
            }
        }
    };

    TEST_F(SchedulerTest, SeverityBands)
    {
        EXPECT_EQ(CaptureScheduler::severityForFailures(1), ErrorSeverity::MEDIUM);
        EXPECT_EQ(CaptureScheduler::severityForFailures(5), ErrorSeverity::MEDIUM);
        EXPECT_EQ(CaptureScheduler::severityForFailures(6), ErrorSeverity::HIGH);
        EXPECT_EQ(CaptureScheduler::severityForFailures(10), ErrorSeverity::HIGH);
        EXPECT_EQ(CaptureScheduler::severityForFailures(11), ErrorSeverity::CRITICAL);
    }

    TEST_F(SchedulerTest, ThreeFailuresAreMedium)
    {
        fail(3);
        EXPECT_EQ(scheduler->consecutiveFailures(), 3);

        vector<ErrorRecord> medium = captureErrors(ErrorSeverity::MEDIUM);
        ASSERT_EQ(medium.size(), 1u);
        EXPECT_EQ(medium[0].occurrence_count, 3);
        // Context is the one captured when the record was first filed
        EXPECT_EQ(medium[0].context["additional_data"]["consecutive_failures"], 1);
        EXPECT_TRUE(captureErrors(ErrorSeverity::HIGH).empty());
    }

    TEST_F(SchedulerTest, SevenFailuresReachHigh)
    {
        fail(7);
        vector<ErrorRecord> high = captureErrors(ErrorSeverity::HIGH);
        ASSERT_EQ(high.size(), 1u);
        EXPECT_EQ(high[0].occurrence_count, 2);
        EXPECT_TRUE(captureErrors(ErrorSeverity::CRITICAL).empty());
    }

    TEST_F(SchedulerTest, TwelveFailuresReachCritical)
    {
        fail(12);
        vector<ErrorRecord> critical = captureErrors(ErrorSeverity::CRITICAL);
        ASSERT_EQ(critical.size(), 1u);
        EXPECT_EQ(critical[0].occurrence_count, 2);
        EXPECT_EQ(critical[0].context["additional_data"]["consecutive_failures"], 11);
        EXPECT_EQ(scheduler->stats().capture_failures, 12);
    }

    TEST_F(SchedulerTest, SuccessResetsTheStreak)
    {
        fail(7);
        EXPECT_TRUE(scheduler->captureOnce());
        EXPECT_EQ(scheduler->consecutiveFailures(), 0);

        // A new streak starts back at MEDIUM
        fail(1);
        EXPECT_EQ(captureErrors(ErrorSeverity::MEDIUM)[0].occurrence_count, 6);
        EXPECT_EQ(scheduler->consecutiveFailures(), 1);
    }

    TEST_F(SchedulerTest, FailureStreakForcesReopen)
    {
        EXPECT_TRUE(scheduler->captureOnce());
        EXPECT_EQ(source->opens, 1);

        fail(5);
        EXPECT_FALSE(source->isOpened());
        EXPECT_TRUE(scheduler->captureOnce());
        EXPECT_EQ(source->opens, 2);
    }

    TEST_F(SchedulerTest, PublishedFramesAreNumbered)
    {
        ASSERT_TRUE(scheduler->captureOnce());
        ASSERT_TRUE(scheduler->captureOnce());

        CapturedFrame frame;
        ASSERT_TRUE(slot->take(frame, 10));
        EXPECT_EQ(frame.frame_number, 2);
        EXPECT_FALSE(frame.image.empty());
        EXPECT_EQ(slot->droppedCount(), 1u);
        EXPECT_EQ(scheduler->stats().frames_captured, 2);
    }

    TEST_F(SchedulerTest, StopWithoutStartIsSafe)
    {
        scheduler->stop();
        scheduler->stop();
        EXPECT_FALSE(scheduler->isRunning());
    }

    TEST_F(SchedulerTest, StartIsIdempotent)
    {
        ASSERT_TRUE(scheduler->start());
        EXPECT_FALSE(scheduler->start());
        EXPECT_TRUE(scheduler->isRunning());

        CapturedFrame frame;
        EXPECT_TRUE(slot->take(frame, 1000));

        scheduler->stop();
        EXPECT_FALSE(scheduler->isRunning());
        EXPECT_FALSE(source->isOpened());
        EXPECT_GE(source->releases.load(), 1);
    }

    TEST_F(SchedulerTest, OpenFailureIsLoggedNotThrown)
    {
        source->open_ok = false;
        EXPECT_FALSE(scheduler->start());
        EXPECT_FALSE(scheduler->isRunning());

        vector<ErrorRecord> high = captureErrors(ErrorSeverity::HIGH);
        ASSERT_EQ(high.size(), 1u);
        EXPECT_EQ(high[0].function, "start");
    }

    TEST_F(SchedulerTest, LoopSurvivesFailingSource)
    {
        source->default_ok = false;
        ASSERT_TRUE(scheduler->start());

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (source->reads < 3 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));

        EXPECT_TRUE(scheduler->isRunning());
        scheduler->stop();
        EXPECT_GE(scheduler->stats().capture_failures, 3);
    }

    TEST_F(SchedulerTest, FastCyclesSleepOutTheInterval)
    {
        // 20ms interval, instant reads
        ASSERT_TRUE(scheduler->start());
        ASSERT_TRUE(waitForReads(6));
        scheduler->stop();

        vector<double> gaps = gapsMs(source->readTimes());
        ASSERT_GE(gaps.size(), 5u);
        for (double gap : gaps)
            EXPECT_GE(gap, 18.0);
    }

    TEST_F(SchedulerTest, SlowCyclesStartTheNextOneImmediately)
    {
        // 100ms interval, 150ms reads: no extra sleep after a late cycle
        rebuild(10, 2000);
        source->read_delay_ms = 150;

        ASSERT_TRUE(scheduler->start());
        ASSERT_TRUE(waitForReads(5));
        scheduler->stop();

        vector<double> gaps = gapsMs(source->readTimes());
        ASSERT_GE(gaps.size(), 4u);

        double total = 0.0;
        for (double gap : gaps)
        {
            EXPECT_GE(gap, 145.0);
            total += gap;
        }
        // Sleeping a full interval after each late cycle would average 250ms
        EXPECT_LT(total / gaps.size(), 215.0);
    }

    TEST_F(SchedulerTest, StuckSourceIsDetachedAndBlocksRestart)
    {
        rebuild(50, 50);
        source->blocked = true;

        ASSERT_TRUE(scheduler->start());
        ASSERT_TRUE(waitForReads(1));

        auto begin = std::chrono::steady_clock::now();
        scheduler->stop();
        EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
        EXPECT_FALSE(scheduler->isRunning());

        // The detached loop still owns the source
        EXPECT_FALSE(scheduler->start());
        vector<ErrorRecord> high = captureErrors(ErrorSeverity::HIGH);
        ASSERT_EQ(high.size(), 1u);
        EXPECT_EQ(high[0].function, "start");
        EXPECT_EQ(source->reads.load(), 1);

        // Once it lets go, capture can start again on a single loop
        source->blocked = false;
        bool restarted = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!restarted && std::chrono::steady_clock::now() < deadline)
        {
            restarted = scheduler->start();
            if (!restarted)
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(restarted);
        EXPECT_GE(source->releases.load(), 1);
        ASSERT_TRUE(waitForReads(4));
        scheduler->stop();
        EXPECT_FALSE(scheduler->isRunning());
    }

    TEST(FrameSlot, KeepsOnlyTheNewestFrame)
    {
        FrameSlot slot;
        CapturedFrame a;
        a.frame_number = 1;
        CapturedFrame b;
        b.frame_number = 2;

        EXPECT_FALSE(slot.publish(a));
        EXPECT_TRUE(slot.publish(b));
        EXPECT_EQ(slot.droppedCount(), 1u);

        CapturedFrame taken;
        ASSERT_TRUE(slot.take(taken, 10));
        EXPECT_EQ(taken.frame_number, 2);
        EXPECT_FALSE(slot.hasFrame());
        EXPECT_FALSE(slot.take(taken, 10));
    }

    TEST(FrameSlot, CloseWakesWaitingConsumer)
    {
        FrameSlot slot;
        std::thread closer([&slot]()
                           {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            slot.close(); });

        CapturedFrame frame;
        auto start = std::chrono::steady_clock::now();
        EXPECT_FALSE(slot.take(frame, 5000));
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
        closer.join();

        EXPECT_FALSE(slot.publish(frame));
        EXPECT_FALSE(slot.hasFrame());
        slot.reopen();
        EXPECT_FALSE(slot.isClosed());
    }

    TEST(FpsCounter, RateOverOneSecondWindow)
    {
        FpsCounter fps;
        auto t0 = FpsCounter::Clock::now();

        for (int i = 0; i <= 10; i++)
            fps.tick(t0 + std::chrono::milliseconds(i * 100));
        EXPECT_NEAR(fps.rate(), 10.0, 1e-6);

        // Slower second window
        for (int i = 1; i <= 4; i++)
            fps.tick(t0 + std::chrono::milliseconds(1000 + i * 250));
        EXPECT_NEAR(fps.rate(), 4.0, 1e-6);
    }

    TEST(FpsCounter, NoRateBeforeFirstWindowCloses)
    {
        FpsCounter fps;
        auto t0 = FpsCounter::Clock::now();
        fps.tick(t0);
        fps.tick(t0 + std::chrono::milliseconds(100));
        EXPECT_DOUBLE_EQ(fps.rate(), 0.0);
    }

} // namespace gtest
