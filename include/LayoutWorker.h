/**
 * @file LayoutWorker.h
 * @brief Channel adapter: runs a LayoutEngine on its own thread and connects it to the controller through two queues.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "LayoutEngine.h"
#include "MessageQueue.h"
#include "Messages.h"

/**
 * @class LayoutWorker
 * @brief Simulation context. The engine it owns is only ever touched by the worker thread.
 *
 * At every iteration boundary the worker drains all queued commands and applies them in arrival order, then
 * runs one iteration if the engine is running and forwards the produced events. Snapshots are moved through
 * the event queue, never shared.
 */
class LayoutWorker {
public:
    struct Options {
        int iterationIntervalMs{16}; // pacing between iterations; 0 iterates as fast as possible
        int idleWaitMs{50};          // sleep granularity while not running
    };

    LayoutWorker();
    explicit LayoutWorker(const Options& opts);
    /** @brief Stops and joins the worker thread. */
    ~LayoutWorker();

    LayoutWorker(const LayoutWorker&) = delete;
    LayoutWorker& operator=(const LayoutWorker&) = delete;

    /** @brief Start the simulation thread (no-op if already started). */
    void start();
    /** @brief Ask the thread to exit and join it. Pending commands are discarded. */
    void shutdown();
    bool isStarted() const { return thread.joinable(); }

    /** @brief Fire-and-forget: enqueue a command for the simulation thread. */
    void post(LayoutCommand cmd);

    /** @brief Pop the oldest pending event without blocking. */
    bool tryReceive(LayoutEvent& out);
    /** @brief Move all pending events to @p out without blocking; returns how many. */
    size_t receiveAll(std::vector<LayoutEvent>& out);
    /** @brief Wait up to @p timeout for an event (for headless callers and tests). */
    bool waitReceive(LayoutEvent& out, std::chrono::milliseconds timeout);

    void setIterationIntervalMs(int ms);
    int iterationIntervalMs() const { return intervalMs.load(); }

private:
    void run();

    MessageQueue<LayoutCommand> commands;
    MessageQueue<LayoutEvent> events;
    LayoutEngine engine;
    std::thread thread;
    std::atomic<bool> threadExit{false};
    std::atomic<int> intervalMs{16};
    int idleWaitMs{50};
};
