#include "diagpack/collect/run_context.hpp"

#include <cstdarg>
#include <cstdio>
#include <string>

namespace diagpack {

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::Idle:            return "Idle";
        case RunState::Preparing:       return "Preparing";
        case RunState::RunningPackages: return "RunningPackages";
        case RunState::Archiving:       return "Archiving";
        case RunState::Finished:        return "Finished";
    }
    return "Unknown";
}

void RunContext::RequestCancel() {
    cancel_.store(true);
}

bool RunContext::CancelRequested() const {
    return cancel_.load();
}

void RunContext::SetEventTap(EventTap tap) {
    std::lock_guard<std::mutex> lk(mu_);
    tap_ = std::move(tap);
}

void RunContext::Emit(RunEvent event) {
    EventTap tap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        tap = tap_;
    }
    if (tap)
        tap(event);

    {
        std::lock_guard<std::mutex> lk(mu_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void RunContext::Notify(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    va_list sized;
    va_copy(sized, ap);
    const int len = std::vsnprintf(nullptr, 0, fmt, sized);
    va_end(sized);
    std::string buf;
    if (len > 0) {
        buf.resize(static_cast<size_t>(len) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        buf.resize(static_cast<size_t>(len));
    }
    va_end(ap);

    Logger::Instance().Log(lvl, "%s", buf.c_str());

    RunEvent e;
    e.type = RunEvent::Type::Log;
    e.level = lvl;
    e.state = State();
    e.message = std::move(buf);
    Emit(std::move(e));
}

void RunContext::ReportProgress(int percent, std::string stage) {
    if (percent > 100)
        percent = 100;
    int prev = progress_.load();
    while (percent > prev) {
        if (progress_.compare_exchange_weak(prev, percent)) {
            RunEvent e;
            e.type = RunEvent::Type::Progress;
            e.state = State();
            e.percent = percent;
            e.message = std::move(stage);
            Emit(std::move(e));
            return;
        }
    }
}

void RunContext::EnterState(RunState state, RunOutcome outcome) {
    state_.store(state);
    if (state == RunState::Finished)
        outcome_.store(outcome);

    RunEvent e;
    e.type = RunEvent::Type::StateChanged;
    e.state = state;
    e.outcome = outcome;
    e.percent = Progress();
    Emit(std::move(e));
}

std::optional<RunEvent> RunContext::WaitForEvent(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this] { return !events_.empty(); }))
        return std::nullopt;
    RunEvent e = std::move(events_.front());
    events_.pop_front();
    return e;
}

std::vector<RunEvent> RunContext::DrainEvents() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<RunEvent> out(std::make_move_iterator(events_.begin()),
                              std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

} // namespace diagpack
