/**
 * @file LayoutWorker.cpp
 * @brief Simulation thread loop: drain commands, iterate, forward events.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LayoutWorker.h"
#include "LayoutError.h"
#include "Logger.h"

#include <algorithm>
#include <string>

LayoutWorker::LayoutWorker() : LayoutWorker(Options{}) {}

LayoutWorker::LayoutWorker(const Options& opts)
    : intervalMs(std::max(0, opts.iterationIntervalMs)), idleWaitMs(std::max(1, opts.idleWaitMs)) {}

LayoutWorker::~LayoutWorker() {
    shutdown();
}

void LayoutWorker::start() {
    if (thread.joinable()) return;
    threadExit.store(false, std::memory_order_relaxed);
    thread = std::thread(&LayoutWorker::run, this);
}

void LayoutWorker::shutdown() {
    if (!thread.joinable()) return;
    threadExit.store(true, std::memory_order_release);
    commands.interrupt();
    thread.join();
}

void LayoutWorker::post(LayoutCommand cmd) {
    commands.push(std::move(cmd));
}

bool LayoutWorker::tryReceive(LayoutEvent& out) {
    return events.tryPop(out);
}

size_t LayoutWorker::receiveAll(std::vector<LayoutEvent>& out) {
    return events.drain(out);
}

bool LayoutWorker::waitReceive(LayoutEvent& out, std::chrono::milliseconds timeout) {
    if (events.tryPop(out)) return true;
    events.waitFor(timeout);
    return events.tryPop(out);
}

void LayoutWorker::setIterationIntervalMs(int ms) {
    intervalMs.store(std::max(0, ms));
}

void LayoutWorker::run() {
    using clock = std::chrono::steady_clock;
    Logger::info("layout worker thread starting");
    std::vector<LayoutCommand> pending;
    std::vector<LayoutEvent> produced;
    auto nextStep = clock::now();
    try {
        while (!threadExit.load(std::memory_order_acquire)) {
            // Iteration boundary: every command that has arrived is applied before the next iteration.
            pending.clear();
            commands.drain(pending);
            for (auto& cmd : pending) {
                try {
                    engine.apply(std::move(cmd));
                } catch (const LayoutError& e) {
                    Logger::warn(std::string("init rejected: ") + e.what());
                }
            }

            if (!engine.isRunning()) {
                commands.waitFor(std::chrono::milliseconds(idleWaitMs));
                nextStep = clock::now();
                continue;
            }

            auto now = clock::now();
            if (now < nextStep) {
                // A command arriving during the wait is applied before the iteration it precedes.
                commands.waitFor(nextStep - now);
                continue;
            }

            produced.clear();
            engine.step(produced);
            for (auto& ev : produced) events.push(std::move(ev));
            nextStep = now + std::chrono::milliseconds(intervalMs.load(std::memory_order_relaxed));
        }
    } catch (const std::exception& e) {
        Logger::logException("layout worker", e);
    }
    Logger::info("layout worker thread exiting");
}
