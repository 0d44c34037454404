/*
 * output_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Output monitor implementation

**************************************************/

#include "output_monitor.hpp"

#include <spdlog/spdlog.h>

namespace wayfarer::supervisor {

namespace {

auto toEventKind(LineKind kind) -> std::optional<MonitorEvent::Kind> {
    switch (kind) {
        case LineKind::BuildComplete:
            return MonitorEvent::Kind::BuildComplete;
        case LineKind::ServeReady:
            return MonitorEvent::Kind::ServeReady;
        case LineKind::EngineError:
            return MonitorEvent::Kind::EngineError;
        case LineKind::BindFailure:
            return MonitorEvent::Kind::BindFailure;
        case LineKind::Activity:
            break;
    }
    return std::nullopt;
}

}  // namespace

OutputMonitor::OutputMonitor(EngineProcess& process, Phase phase,
                             const LineClassifier& classifier,
                             ActivityState& activity, MonitorQueue& queue,
                             OutputMonitorOptions options)
    : process_(process),
      phase_(phase),
      classifier_(classifier),
      activity_(activity),
      queue_(queue),
      options_(std::move(options)) {
    if (options_.logFile) {
        std::error_code ec;
        std::filesystem::create_directories(options_.logFile->parent_path(),
                                            ec);
        logStream_.open(*options_.logFile, std::ios::out | std::ios::app);
        if (!logStream_) {
            spdlog::warn("Cannot open engine log file {}",
                         options_.logFile->string());
        }
    }
}

OutputMonitor::~OutputMonitor() { stop(); }

void OutputMonitor::start() {
    if (thread_.joinable()) {
        return;
    }
    stopRequested_ = false;
    thread_ = std::thread([this] { run(); });
}

void OutputMonitor::stop() {
    stopRequested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (logStream_.is_open()) {
        logStream_.flush();
        logStream_.close();
    }
}

auto OutputMonitor::waitForEof(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(finishedMutex_);
    return finishedCv_.wait_for(lock, timeout, [this] { return finished_; });
}

auto OutputMonitor::finished() const -> bool {
    std::lock_guard lock(finishedMutex_);
    return finished_;
}

auto OutputMonitor::recentLines() const -> std::vector<std::string> {
    std::lock_guard lock(historyMutex_);
    return {history_.begin(), history_.end()};
}

auto OutputMonitor::lastLine() const -> std::string {
    std::lock_guard lock(historyMutex_);
    return lastLine_;
}

void OutputMonitor::run() {
    spdlog::debug("{} output monitor started for pid {}", toString(phase_),
                  process_.pid());

    std::string line;
    while (!stopRequested_) {
        auto status = process_.readLine(line, options_.readTimeout);
        if (status == EngineProcess::ReadStatus::Line) {
            handleLine(std::move(line));
            line.clear();
        } else if (status == EngineProcess::ReadStatus::Closed) {
            queue_.push(MonitorEvent{MonitorEvent::Kind::StreamClosed, {},
                                     std::nullopt,
                                     activity_.clock()->now()});
            break;
        }
    }

    markFinished();
    spdlog::debug("{} output monitor finished for pid {}", toString(phase_),
                  process_.pid());
}

void OutputMonitor::handleLine(std::string line) {
    activity_.touch();
    spdlog::debug(">> {}", line);

    if (logStream_.is_open()) {
        logStream_ << line << '\n';
    }

    auto classification = classifier_.classify(line, phase_);

    {
        std::lock_guard lock(historyMutex_);
        history_.push_back(line);
        while (history_.size() > options_.historySize) {
            history_.pop_front();
        }
        lastLine_ = line;
    }

    if (auto kind = toEventKind(classification.kind)) {
        spdlog::info("Engine marker {} matched '{}'",
                     toString(classification.kind), classification.pattern);
        if (!queue_.push(MonitorEvent{*kind, std::move(line),
                                      classification.port,
                                      activity_.clock()->now()})) {
            spdlog::debug("{} marker dropped, the run was already released",
                          toString(classification.kind));
        }
    }
}

void OutputMonitor::markFinished() {
    {
        std::lock_guard lock(finishedMutex_);
        finished_ = true;
    }
    finishedCv_.notify_all();
}

}  // namespace wayfarer::supervisor
