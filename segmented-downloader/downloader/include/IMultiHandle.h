#pragma once
// =============================================================================
// IMultiHandle.h
// 単一スレッドで複数転送を駆動するイベントループの抽象化
// 本番実装は CurlMulti (curl_multi_*), テスト用はモック
// =============================================================================

#include "IHttpHandle.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SegmentedDownloader {

/// 完了した転送
struct CompletedTransfer {
    IHttpHandle*    handle = nullptr;
    TransportResult result = TransportResult::OK;
};

class IMultiHandle {
public:
    virtual ~IMultiHandle() = default;

    /// @brief このマルチハンドルに登録可能なハンドルを生成する
    virtual std::unique_ptr<IHttpHandle> createHandle() = 0;

    /// @brief 転送を開始対象に追加する
    /// @return false: 登録失敗 (getLastError 参照)
    virtual bool addHandle(IHttpHandle* handle) = 0;

    /// @brief 転送を取り外す (完了・中断どちらでも呼ぶ)
    virtual void removeHandle(IHttpHandle* handle) = 0;

    /// @brief 進められる転送をすべて進める (ブロックしない)
    /// @param running 実行中の転送数
    virtual bool perform(int& running) = 0;

    /// @brief ソケットが読み書き可能になるか timeout まで待機する
    virtual bool poll(std::chrono::milliseconds timeout) = 0;

    /// @brief 前回呼び出し以降に完了した転送を取り出す
    virtual std::vector<CompletedTransfer> readCompleted() = 0;

    virtual std::string getLastError() const = 0;
};

using MultiHandleFactory = std::function<std::unique_ptr<IMultiHandle>()>;

} // namespace SegmentedDownloader
