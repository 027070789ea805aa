#include "LayoutController.h"
#include "LayoutWorker.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

GraphNode makeNode(const std::string& id)
{
    GraphNode n;
    n.id = id;
    return n;
}

LayoutWorker::Options fastOptions()
{
    LayoutWorker::Options o;
    o.iterationIntervalMs = 0;
    o.idleWaitMs = 5;
    return o;
}

// Collects events until a settled event arrives or the deadline passes.
bool collectUntilSettled(LayoutWorker& worker, std::vector<LayoutEvent>& out,
                         std::chrono::milliseconds deadline = 10s)
{
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        LayoutEvent ev;
        if (!worker.waitReceive(ev, 50ms)) continue;
        bool done = std::holds_alternative<SettledEvent>(ev);
        out.push_back(std::move(ev));
        if (done) return true;
    }
    return false;
}

TEST(LayoutWorker, RunsSessionToSettled)
{
    LayoutWorker worker(fastOptions());
    worker.start();
    ASSERT_TRUE(worker.isStarted());
    worker.post(InitCommand{{makeNode("a"), makeNode("b")}, {GraphLink{"a", "b", LinkKind::Subfeature}},
                            LayoutConfig::defaults()});

    std::vector<LayoutEvent> events;
    ASSERT_TRUE(collectUntilSettled(worker, events));
    size_t ticks = 0;
    for (auto& ev : events) {
        if (auto* tick = std::get_if<TickEvent>(&ev)) {
            ++ticks;
            EXPECT_EQ(tick->positions.nodeCount(), 2u);
        }
    }
    EXPECT_EQ(ticks, 313u);

    std::this_thread::sleep_for(50ms);
    LayoutEvent extra;
    EXPECT_FALSE(worker.tryReceive(extra));
    worker.shutdown();
    EXPECT_FALSE(worker.isStarted());
}

TEST(LayoutWorker, RejectedInitEmitsNothingAndNextInitWorks)
{
    LayoutWorker worker(fastOptions());
    worker.start();
    worker.post(InitCommand{{makeNode("a")}, {GraphLink{"a", "nowhere", LinkKind::Overlap}}, LayoutConfig::defaults()});
    LayoutEvent ev;
    EXPECT_FALSE(worker.waitReceive(ev, 100ms));

    worker.post(InitCommand{{makeNode("a"), makeNode("b")}, {}, LayoutConfig::defaults()});
    EXPECT_TRUE(worker.waitReceive(ev, 5s));
    EXPECT_TRUE(std::holds_alternative<TickEvent>(ev));
}

TEST(LayoutWorker, FixedNodeStaysFixed)
{
    LayoutWorker worker(fastOptions());
    worker.start();
    GraphNode anchor = makeNode("anchor");
    anchor.fx = 12.5;
    anchor.fy = -7.0;
    worker.post(InitCommand{{anchor, makeNode("b"), makeNode("c")},
                            {GraphLink{"anchor", "b", LinkKind::Orchestrator}, GraphLink{"b", "c", LinkKind::Subfeature}},
                            LayoutConfig::defaults()});
    std::vector<LayoutEvent> events;
    ASSERT_TRUE(collectUntilSettled(worker, events));
    for (auto& ev : events) {
        if (auto* tick = std::get_if<TickEvent>(&ev)) {
            EXPECT_EQ(tick->positions.x(0), 12.5);
            EXPECT_EQ(tick->positions.y(0), -7.0);
        }
    }
}

TEST(LayoutWorker, StopSilencesStreamUntilRestart)
{
    LayoutWorker::Options opts = fastOptions();
    opts.iterationIntervalMs = 2;
    LayoutWorker worker(opts);
    worker.start();
    worker.post(InitCommand{{makeNode("a"), makeNode("b")}, {GraphLink{"a", "b", LinkKind::Subfeature}},
                            LayoutConfig::defaults()});
    LayoutEvent ev;
    ASSERT_TRUE(worker.waitReceive(ev, 5s));

    worker.post(StopCommand{});
    std::this_thread::sleep_for(100ms);
    std::vector<LayoutEvent> drained;
    worker.receiveAll(drained);
    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(worker.tryReceive(ev));

    worker.post(RestartCommand{});
    ASSERT_TRUE(worker.waitReceive(ev, 5s));
    auto* tick = std::get_if<TickEvent>(&ev);
    ASSERT_NE(tick, nullptr);
    ASSERT_TRUE(tick->alpha);
    EXPECT_LT(*tick->alpha, 0.3);
}

TEST(LayoutWorker, IntervalPacesIterations)
{
    LayoutWorker::Options opts = fastOptions();
    opts.iterationIntervalMs = 20;
    LayoutWorker worker(opts);
    EXPECT_EQ(worker.iterationIntervalMs(), 20);
    worker.start();
    worker.post(InitCommand{{makeNode("a"), makeNode("b")}, {}, LayoutConfig::defaults()});
    std::this_thread::sleep_for(200ms);
    std::vector<LayoutEvent> events;
    worker.receiveAll(events);
    // About 10 iterations, one tick per two of them.
    EXPECT_GE(events.size(), 1u);
    EXPECT_LE(events.size(), 8u);

    worker.setIterationIntervalMs(-5);
    EXPECT_EQ(worker.iterationIntervalMs(), 0);
}

TEST(LayoutController, PollDeliversTicksAndSettled)
{
    LayoutController controller(fastOptions());
    size_t tickCalls = 0;
    double settledAlpha = -1.0;
    controller.onTick([&](const PositionBuffer& buf, std::optional<double>) {
        ++tickCalls;
        EXPECT_EQ(buf.nodeCount(), 3u);
    });
    controller.onSettled([&](double a) { settledAlpha = a; });

    controller.init({makeNode("a"), makeNode("b"), makeNode("c")},
                    {GraphLink{"a", "b", LinkKind::Orchestrator}, GraphLink{"a", "c", LinkKind::Subfeature}});
    EXPECT_FALSE(controller.hasPositions());

    auto until = std::chrono::steady_clock::now() + 10s;
    while (!controller.settled() && std::chrono::steady_clock::now() < until) {
        controller.poll();
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(controller.settled());
    EXPECT_TRUE(controller.hasPositions());
    EXPECT_EQ(controller.positions().nodeCount(), 3u);
    EXPECT_EQ(controller.ticksReceived(), tickCalls);
    EXPECT_GT(tickCalls, 0u);
    EXPECT_GE(settledAlpha, 0.0);
    EXPECT_LT(settledAlpha, 0.001);
    ASSERT_TRUE(controller.lastAlpha());
    EXPECT_EQ(*controller.lastAlpha(), settledAlpha);

    controller.reheat();
    EXPECT_FALSE(controller.settled());
    until = std::chrono::steady_clock::now() + 10s;
    while (!controller.settled() && std::chrono::steady_clock::now() < until) {
        controller.poll();
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(controller.settled());
}

TEST(LayoutController, ReinitDiscardsEventsOfPreviousGraph)
{
    LayoutController controller(fastOptions());
    size_t wrongSize = 0;
    controller.onTick([&](const PositionBuffer& buf, std::optional<double>) {
        if (buf.nodeCount() != 5) ++wrongSize;
    });
    controller.init({makeNode("a"), makeNode("b"), makeNode("c")}, {GraphLink{"a", "b", LinkKind::Subfeature}});
    // The first graph settles while nothing is polled, leaving its ticks and settled event queued.
    std::this_thread::sleep_for(500ms);

    controller.init({makeNode("p"), makeNode("q"), makeNode("r"), makeNode("s"), makeNode("t")},
                    {GraphLink{"p", "q", LinkKind::Orchestrator}, GraphLink{"q", "r", LinkKind::Subfeature}});
    EXPECT_EQ(controller.session(), 2u);
    controller.poll();
    EXPECT_FALSE(controller.settled());
    if (controller.hasPositions()) EXPECT_EQ(controller.positions().size(), 10u);

    auto until = std::chrono::steady_clock::now() + 10s;
    while (!controller.settled() && std::chrono::steady_clock::now() < until) {
        controller.poll();
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(controller.settled());
    EXPECT_EQ(controller.positions().size(), 10u);
    EXPECT_EQ(wrongSize, 0u);
}

TEST(LayoutController, PinnedNodeReportedAtPin)
{
    LayoutController controller(fastOptions());
    controller.init({makeNode("a"), makeNode("b")}, {GraphLink{"a", "b", LinkKind::Subfeature}});
    controller.pinNode(1, -30.0, 45.0);
    controller.setAlphaTarget(0.2);

    auto until = std::chrono::steady_clock::now() + 5s;
    while (controller.ticksReceived() < 20 && std::chrono::steady_clock::now() < until) {
        controller.poll();
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_GE(controller.ticksReceived(), 20u);
    EXPECT_EQ(controller.positions().x(1), -30.0);
    EXPECT_EQ(controller.positions().y(1), 45.0);
    EXPECT_FALSE(controller.settled());
    controller.stop();
}

}  // namespace
