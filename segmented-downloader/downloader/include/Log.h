#pragma once
// =============================================================================
// Log.h
// プロセス共通のロガー
//
// 出力形式: [HH:MM:SS.mmm][LEVEL][tag] message
// 複数ジョブ・複数ワーカーから同時に呼ばれるため、1 行単位で mutex により直列化する
// =============================================================================

#include <mutex>
#include <sstream>
#include <string>

namespace SegmentedDownloader {

/// ログレベル
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF ///< 全出力を抑止 (テスト用)
};

/// 現在時刻を "HH:MM:SS.mmm" 形式で返す
std::string currentTime();

/// @brief スレッドセーフなロガー (シングルトン)
class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// @brief 指定レベルが出力対象かどうか
    bool enabled(LogLevel level) const;

    /// @brief 1 行出力する
    void write(LogLevel level, const std::string& tag, const std::string& message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel           level_{LogLevel::INFO};
};

} // namespace SegmentedDownloader

/// ログ出力マクロ
/// msg は ostream の << で連結可能な式 (レベル無効時は評価しない)
#define SEGDL_LOG(level, tag, msg)                                              \
    do {                                                                        \
        auto& segdlLogger_ = ::SegmentedDownloader::Logger::instance();         \
        if (segdlLogger_.enabled(level)) {                                      \
            std::ostringstream segdlOss_;                                       \
            segdlOss_ << msg;                                                   \
            segdlLogger_.write(level, (tag), segdlOss_.str());                  \
        }                                                                       \
    } while (0)

#define SEGDL_LOG_DEBUG(tag, msg) SEGDL_LOG(::SegmentedDownloader::LogLevel::DEBUG, tag, msg)
#define SEGDL_LOG_INFO(tag, msg)  SEGDL_LOG(::SegmentedDownloader::LogLevel::INFO, tag, msg)
#define SEGDL_LOG_WARN(tag, msg)  SEGDL_LOG(::SegmentedDownloader::LogLevel::WARN, tag, msg)
#define SEGDL_LOG_ERROR(tag, msg) SEGDL_LOG(::SegmentedDownloader::LogLevel::ERROR, tag, msg)
