#pragma once
// =============================================================================
// MemoryJobStore.h
// IJobStore のインメモリ実装 (単一 mutex で全操作を直列化する)
// =============================================================================

#include "IJobStore.h"

#include <map>
#include <mutex>

namespace SegmentedDownloader {

class MemoryJobStore final : public IJobStore {
public:
    MemoryJobStore() = default;

    MemoryJobStore(const MemoryJobStore&)            = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    JobId addJob(const std::string& url, const JobSettings& settings) override;
    std::optional<Job> claimNextQueued() override;
    void updateMetadata(JobId id, const JobMetadata& metadata) override;
    void updateBitmap(JobId id, const std::vector<uint8_t>& bitmap) override;
    void setState(JobId id, JobState state) override;
    Job get(JobId id) const override;
    std::vector<Job> list() const override;
    size_t recoverStaleRunning() override;

    /// @brief ジョブをそのまま登録する (状態の復元用)
    void put(const Job& job);

private:
    Job& at(JobId id);
    const Job& at(JobId id) const;

    mutable std::mutex   mutex_;
    std::map<JobId, Job> jobs_; ///< id 昇順 = 追加順
    JobId                nextId_{1};
};

} // namespace SegmentedDownloader
