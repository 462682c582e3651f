#pragma once
// =============================================================================
// MockMultiHandle.h
// テスト用 IMultiHandle モック実装
//
// perform() が performsPerCompletion 回呼ばれるたびに、登録済みで未完了の
// ハンドルを 1 件ずつ MockHttpHandle::perform で最後まで進め、完了キューに積む
// 統計 (同時登録数の最大値・poll のタイムアウト) は MockMultiStats に記録し、
// バックエンドがハンドルを破棄した後もテストから参照できるようにする
// =============================================================================

#include "IMultiHandle.h"
#include "MockHttpHandle.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace SegmentedDownloader {
namespace Test {

/// poll 1 回分の記録
struct PollRecord {
    std::chrono::milliseconds timeout{0};
    size_t                    attached = 0; ///< 呼び出し時に登録されていた転送数
};

/// MockMultiHandle の観測結果
struct MockMultiStats {
    size_t                  maxAttached  = 0;
    size_t                  performCount = 0;
    std::vector<PollRecord> polls;
};

class MockMultiHandle final : public IMultiHandle {
public:
    explicit MockMultiHandle(MockHttpServer& server,
                             std::shared_ptr<MockMultiStats> stats = nullptr,
                             size_t performsPerCompletion = 1)
        : server_(server)
        , stats_(stats ? std::move(stats) : std::make_shared<MockMultiStats>())
        , performsPerCompletion_(std::max<size_t>(1, performsPerCompletion)) {}

    std::unique_ptr<IHttpHandle> createHandle() override {
        return std::make_unique<MockHttpHandle>(server_);
    }

    bool addHandle(IHttpHandle* handle) override {
        if (!handle) {
            lastError_ = "null handle";
            return false;
        }
        attached_.push_back(handle);
        waiting_.push_back(handle);
        stats_->maxAttached = std::max(stats_->maxAttached, attached_.size());
        return true;
    }

    void removeHandle(IHttpHandle* handle) override {
        attached_.erase(std::remove(attached_.begin(), attached_.end(), handle),
                        attached_.end());
        waiting_.erase(std::remove(waiting_.begin(), waiting_.end(), handle),
                       waiting_.end());
    }

    bool perform(int& running) override {
        ++stats_->performCount;
        if (!waiting_.empty() && ++sinceCompletion_ >= performsPerCompletion_) {
            sinceCompletion_ = 0;
            IHttpHandle* handle = waiting_.front();
            waiting_.pop_front();
            completed_.push_back({handle, handle->perform()});
        }
        running = static_cast<int>(waiting_.size());
        return true;
    }

    bool poll(std::chrono::milliseconds timeout) override {
        stats_->polls.push_back({timeout, attached_.size()});
        return true;
    }

    std::vector<CompletedTransfer> readCompleted() override {
        std::vector<CompletedTransfer> out(completed_.begin(), completed_.end());
        completed_.clear();
        return out;
    }

    std::string getLastError() const override { return lastError_; }

    const MockMultiStats& stats() const { return *stats_; }

private:
    MockHttpServer&                server_;
    std::vector<IHttpHandle*>      attached_;
    std::deque<IHttpHandle*>       waiting_;
    std::deque<CompletedTransfer>  completed_;
    std::shared_ptr<MockMultiStats> stats_;
    size_t                         performsPerCompletion_ = 1;
    size_t                         sinceCompletion_       = 0;
    std::string                    lastError_;
};

/// @brief MockHttpServer に接続する MockMultiHandle のファクトリ
inline MultiHandleFactory mockMultiFactory(MockHttpServer& server) {
    return [&server]() -> std::unique_ptr<IMultiHandle> {
        return std::make_unique<MockMultiHandle>(server);
    };
}

} // namespace Test
} // namespace SegmentedDownloader
