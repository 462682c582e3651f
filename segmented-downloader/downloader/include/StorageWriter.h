#pragma once
// =============================================================================
// StorageWriter.h
// ジョブごとの一時ファイルを管理する
//
//  - 事前確保 (posix_fallocate, 未対応 FS では ftruncate にフォールバック)
//  - 位置指定書き込み (pwrite) - 範囲が重ならない複数ライターから同時に呼べる
//  - sync / finalize は書き込み中のライターと直列化する (shared_mutex)
//  - finalize は一時ファイルを最終名へアトミックに rename する
//
// エラーは std::system_error (errno 付き) で通知する
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>

namespace SegmentedDownloader {

/// 事前確保に使われた方式
enum class PreallocationMode {
    FALLOCATE, ///< 実ブロックを確保した
    TRUNCATE   ///< 論理長のみ伸ばした (スパース)
};

class StorageWriter {
    /// create / openExisting 以外からの構築を禁止するための鍵
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// @brief 開いた fd の所有権を受け取る (create / openExisting 専用)
    StorageWriter(Passkey, std::filesystem::path tempPath, int fd);

    /// @brief 一時ファイルを新規作成する (既存なら切り詰める)
    /// @throws std::system_error
    static std::unique_ptr<StorageWriter> create(const std::filesystem::path& tempPath);

    /// @brief 既存の一時ファイルをレジューム用に開く
    /// @throws std::system_error ファイルが存在しない場合など
    static std::unique_ptr<StorageWriter> openExisting(const std::filesystem::path& tempPath);

    /// 最終パスに対応する一時ファイルパス ("<final>.part")
    static std::filesystem::path tempPathFor(const std::filesystem::path& finalPath);

    /// デストラクタ - 開いていればクローズする (RAII)
    ~StorageWriter();

    // ファイルディスクリプタを持つためコピー・ムーブ不可
    StorageWriter(const StorageWriter&)            = delete;
    StorageWriter& operator=(const StorageWriter&) = delete;
    StorageWriter(StorageWriter&&)                 = delete;
    StorageWriter& operator=(StorageWriter&&)      = delete;

    /// @brief ファイルを size バイトまで確保する (未書き込み領域はゼロ)
    PreallocationMode preallocate(int64_t size);

    /// @brief offset から data を書き込む (短い書き込みは続きを書く)
    /// @throws std::system_error 書き込み失敗 / クローズ済み
    void writeAt(int64_t offset, const char* data, size_t size);

    /// @brief fsync で永続化する
    void sync();

    /// @brief sync してクローズし、finalPath へ rename する
    /// @param overwrite false の場合、finalPath が既に存在すれば EEXIST で失敗する
    void finalize(const std::filesystem::path& finalPath, bool overwrite);

    /// @brief クローズする (以降の writeAt は EBADF)
    void close();

    /// 現在のファイルサイズ
    int64_t size() const;

    bool isOpen() const;
    const std::filesystem::path& tempPath() const { return tempPath_; }

private:
    void closeLocked();

    std::filesystem::path     tempPath_;
    int                       fd_{-1};
    mutable std::shared_mutex ioMutex_; ///< 書き込み = shared, sync/finalize/close = exclusive
};

} // namespace SegmentedDownloader
