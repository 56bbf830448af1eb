#pragma once

#include "diagpack/collect/collection_result.hpp"
#include "diagpack/util/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace diagpack {

enum class RunState {
    Idle,
    Preparing,
    RunningPackages,
    Archiving,
    Finished,
};

const char* RunStateName(RunState state);

struct RunEvent {
    enum class Type {
        StateChanged,
        Progress,
        Log,
        PackageStarted,
        PackageFinished,
    };

    Type type = Type::Log;
    RunState state = RunState::Idle;
    RunOutcome outcome = RunOutcome::None;
    int percent = 0;
    LogLevel level = LogLevel::Info;
    std::string package_id;
    std::size_t package_index = 0;
    std::string message;
};

// Everything the host thread and the collection worker share: the one-shot
// cancellation flag and the event queue the worker publishes to.
class RunContext {
  public:
    using EventTap = std::function<void(const RunEvent&)>;

    RunContext() = default;
    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    void RequestCancel();
    bool CancelRequested() const;

    // Called on the worker thread for every event, before it is queued.
    void SetEventTap(EventTap tap);

    void Emit(RunEvent event);
    void Notify(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    // Ignored unless it moves the percentage forward.
    void ReportProgress(int percent, std::string stage);
    void EnterState(RunState state, RunOutcome outcome = RunOutcome::None);

    RunState State() const { return state_.load(); }
    RunOutcome Outcome() const { return outcome_.load(); }
    int Progress() const { return progress_.load(); }

    std::optional<RunEvent> WaitForEvent(std::chrono::milliseconds timeout);
    std::vector<RunEvent> DrainEvents();

  private:
    std::atomic_bool cancel_{false};
    std::atomic<RunState> state_{RunState::Idle};
    std::atomic<RunOutcome> outcome_{RunOutcome::None};
    std::atomic<int> progress_{0};

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<RunEvent> events_;
    EventTap tap_;
};

} // namespace diagpack
