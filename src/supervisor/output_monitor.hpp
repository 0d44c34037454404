/*
 * output_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Reader thread consuming and classifying engine output

**************************************************/

#ifndef WAYFARER_SUPERVISOR_OUTPUT_MONITOR_HPP
#define WAYFARER_SUPERVISOR_OUTPUT_MONITOR_HPP

#include "activity_state.hpp"
#include "engine_process.hpp"
#include "event_queue.hpp"
#include "line_classifier.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace wayfarer::supervisor {

struct OutputMonitorOptions {
    std::size_t historySize{50};
    std::optional<std::filesystem::path> logFile;  ///< Tee output here
    std::chrono::milliseconds readTimeout{100};     ///< Stop latency bound
};

/**
 * @brief Reads one engine's output on a dedicated thread
 *
 * Every line touches the activity state, is kept in a bounded history and
 * is classified. Marker lines are pushed to the queue as events, and the end
 * of the stream is reported as StreamClosed.
 *
 * The process, classifier, activity state and queue must outlive the
 * monitor.
 */
class OutputMonitor {
public:
    OutputMonitor(EngineProcess& process, Phase phase,
                  const LineClassifier& classifier, ActivityState& activity,
                  MonitorQueue& queue, OutputMonitorOptions options = {});
    ~OutputMonitor();

    OutputMonitor(const OutputMonitor&) = delete;
    OutputMonitor& operator=(const OutputMonitor&) = delete;

    void start();

    /**
     * @brief Stop the reader thread and join it
     */
    void stop();

    /**
     * @brief Wait until the reader saw end of stream
     * @return true if the stream closed within the timeout
     */
    auto waitForEof(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto finished() const -> bool;

    [[nodiscard]] auto recentLines() const -> std::vector<std::string>;

    [[nodiscard]] auto lastLine() const -> std::string;

    [[nodiscard]] auto phase() const noexcept -> Phase { return phase_; }

private:
    void run();
    void handleLine(std::string line);
    void markFinished();

    EngineProcess& process_;
    Phase phase_;
    const LineClassifier& classifier_;
    ActivityState& activity_;
    MonitorQueue& queue_;
    OutputMonitorOptions options_;

    std::thread thread_;
    std::atomic<bool> stopRequested_{false};

    mutable std::mutex historyMutex_;
    std::deque<std::string> history_;
    std::string lastLine_;

    std::ofstream logStream_;

    mutable std::mutex finishedMutex_;
    std::condition_variable finishedCv_;
    bool finished_{false};
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_OUTPUT_MONITOR_HPP
