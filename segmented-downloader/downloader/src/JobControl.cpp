// =============================================================================
// JobControl.cpp
// =============================================================================

#include "JobControl.h"
#include "Log.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "Control";

/// 親トークンの中断は通知されないため、待機はこの間隔で区切って確認する
constexpr std::chrono::milliseconds WAIT_SLICE{50};

} // namespace

const char* toString(ControlSignal signal) {
    switch (signal) {
    case ControlSignal::NONE:   return "none";
    case ControlSignal::PAUSE:  return "pause";
    case ControlSignal::CANCEL: return "cancel";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// AbortToken
// -----------------------------------------------------------------------------

void AbortToken::abort(ControlSignal signal) {
    ControlSignal expected = ControlSignal::NONE;
    signal_.compare_exchange_strong(expected, signal, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool AbortToken::isAborted() const {
    if (aborted_.load(std::memory_order_acquire)) {
        return true;
    }
    return parent_ && parent_->isAborted();
}

bool AbortToken::waitFor(std::chrono::milliseconds duration) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (isAborted()) {
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now);
        cv_.wait_for(lock, std::min(remaining, WAIT_SLICE));
    }
}

// -----------------------------------------------------------------------------
// コマンド解析
// -----------------------------------------------------------------------------

std::optional<ControlCommand> parseControlCommand(const std::string& line) {
    std::istringstream in(line);
    std::string verb;
    std::string idText;
    std::string extra;
    if (!(in >> verb >> idText) || (in >> extra)) {
        return std::nullopt;
    }

    ControlCommand command;
    if (verb == "pause") {
        command.signal = ControlSignal::PAUSE;
    } else if (verb == "cancel") {
        command.signal = ControlSignal::CANCEL;
    } else {
        return std::nullopt;
    }

    if (idText.empty() ||
        !std::all_of(idText.begin(), idText.end(),
                     [](char c) { return c >= '0' && c <= '9'; }) ||
        idText.size() > 18) {
        return std::nullopt;
    }
    command.jobId = std::stoll(idText);
    return command;
}

// -----------------------------------------------------------------------------
// JobControl
// -----------------------------------------------------------------------------

std::shared_ptr<AbortToken> JobControl::registerJob(JobId id) {
    auto token = std::make_shared<AbortToken>();
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[id] = token;
    auto it = pending_.find(id);
    if (it != pending_.end()) {
        SEGDL_LOG_INFO(TAG, "applying pending " << toString(it->second) << " to job " << id);
        token->abort(it->second);
        pending_.erase(it);
    }
    return token;
}

void JobControl::unregisterJob(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(id);
}

bool JobControl::awaitingRegistration(JobId id) const {
    if (!store_) {
        return false;
    }
    try {
        const JobState state = store_->get(id).state;
        return state == JobState::QUEUED || state == JobState::RUNNING;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool JobControl::requestAbort(JobId id, ControlSignal signal) {
    std::shared_ptr<AbortToken> token;
    {
        // registerJob と競合しないよう保留の判定もロック下で行う
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(id);
        if (it == tokens_.end()) {
            if (!awaitingRegistration(id)) {
                return false;
            }
            // 先に届いた信号を優先する (AbortToken と同じ)
            pending_.emplace(id, signal);
            SEGDL_LOG_INFO(TAG, toString(signal) << " pending for job " << id);
            return true;
        }
        token = it->second;
    }
    SEGDL_LOG_INFO(TAG, toString(signal) << " requested for job " << id);
    token->abort(signal);
    return true;
}

std::string JobControl::handleCommand(const std::string& line) {
    auto command = parseControlCommand(line);
    if (!command) {
        return "bad command";
    }
    return requestAbort(command->jobId, command->signal) ? "ok" : "unknown job";
}

bool JobControl::isRegistered(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.count(id) != 0;
}

ControlSignal JobControl::pendingSignal(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    return it == pending_.end() ? ControlSignal::NONE : it->second;
}

} // namespace SegmentedDownloader
