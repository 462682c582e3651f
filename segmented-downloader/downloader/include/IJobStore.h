#pragma once
// =============================================================================
// IJobStore.h
// ジョブ永続化層の契約
//
// ジョブの状態・メタデータ・ビットマップを実行をまたいで保持する
// claimNextQueued は複数のスケジューラから同時に呼ばれても、
// 同じジョブを二重に RUNNING へ遷移させてはならない
// =============================================================================

#include "IHttpHandle.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SegmentedDownloader {

using JobId = int64_t;

/// ジョブのライフサイクル
enum class JobState {
    QUEUED,    ///< 実行待ち
    RUNNING,   ///< 実行中
    PAUSED,    ///< pause/cancel により停止 (進捗は永続化済み)
    ERROR,     ///< 致命的エラー (明示的に再キューするまで再実行しない)
    COMPLETED  ///< 完了
};

const char* toString(JobState state);

/// ジョブ単位の設定
struct JobSettings {
    std::string downloadDir;   ///< 空なら EngineConfig::downloadDir
    HeaderList  customHeaders;
    bool        overwrite = false;
};

/// 実行中に確定するメタデータ
struct JobMetadata {
    std::optional<std::string> finalFilename;
    std::optional<std::string> tempFilename;
    std::optional<int64_t>     totalSize;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    size_t                     segmentCount = 0; ///< 0 = 分割なし (単一ストリーム)
    std::vector<uint8_t>       completedBitmap;
};

struct Job {
    JobId       id = 0;
    std::string url;
    JobSettings settings;
    JobMetadata metadata;
    JobState    state = JobState::QUEUED;
};

/// @brief ジョブストアのインターフェース
/// 未知の id を渡した場合は std::out_of_range を送出する
class IJobStore {
public:
    virtual ~IJobStore() = default;

    /// @brief QUEUED のジョブを追加する
    virtual JobId addJob(const std::string& url, const JobSettings& settings) = 0;

    /// @brief QUEUED のジョブを 1 件アトミックに RUNNING へ遷移させて返す
    virtual std::optional<Job> claimNextQueued() = 0;

    virtual void updateMetadata(JobId id, const JobMetadata& metadata) = 0;
    virtual void updateBitmap(JobId id, const std::vector<uint8_t>& bitmap) = 0;
    virtual void setState(JobId id, JobState state) = 0;
    virtual Job get(JobId id) const = 0;
    virtual std::vector<Job> list() const = 0;

    /// @brief 前回のクラッシュで RUNNING のまま残ったジョブを QUEUED に戻す
    /// @return 戻した件数
    virtual size_t recoverStaleRunning() = 0;
};

} // namespace SegmentedDownloader
