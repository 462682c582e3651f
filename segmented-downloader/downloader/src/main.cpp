// =============================================================================
// main.cpp
// セグメント分割ダウンローダーのサンプル
//
// 実行例:
//   segdl https://example.com/file.zip ./downloads --multi --control /tmp/segdl.sock
//
// 別端末から一時停止:
//   echo "pause 1" | socat - UNIX-CONNECT:/tmp/segdl.sock
// 同じコマンドを再実行すると未完了のセグメントだけを取得して再開する
// =============================================================================

#include "ConnectionBudget.h"
#include "ControlServer.h"
#include "EngineConfig.h"
#include "HostPolicy.h"
#include "IJobObserver.h"
#include "JobControl.h"
#include "Log.h"
#include "MemoryJobStore.h"
#include "Scheduler.h"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

using namespace SegmentedDownloader;

namespace {

constexpr const char* TAG = "Main";

// =============================================================================
// ConsoleObserver: コンソールに全イベントを出力するオブザーバー実装
// =============================================================================
class ConsoleObserver final : public IJobObserver {
public:
    // -------------------------------------------------------------------------
    // 状態遷移通知
    // -------------------------------------------------------------------------
    void onStateChanged(JobId id, JobState state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state != JobState::RUNNING) {
            std::cout << "\n"; // 進捗バーの行を改行
        }
        SEGDL_LOG_INFO(TAG, "job " << id << " >>> " << toString(state) << " <<<");
        last_ = state;
    }

    // -------------------------------------------------------------------------
    // 進捗通知: プログレスバーをコンソールに描画する
    // -------------------------------------------------------------------------
    void onProgress(JobId /*id*/, const ProgressStats& stats) override {
        constexpr int BAR_WIDTH = 40;
        std::ostringstream oss;

        const double fraction = stats.fraction();
        if (fraction >= 0.0) {
            const int filled = static_cast<int>(fraction * BAR_WIDTH);
            oss << "[";
            for (int i = 0; i < BAR_WIDTH; ++i) {
                oss << (i < filled ? '#' : '-');
            }
            oss << "] " << std::fixed << std::setprecision(1) << fraction * 100.0 << "% ";
        } else {
            oss << "[" << std::string(BAR_WIDTH, '?') << "] --.-% ";
        }

        oss << humanize(stats.bytesDone + stats.bytesInFlight) << " / "
            << humanize(stats.totalBytes) << "  "
            << stats.segmentsDone << "/" << stats.segmentCount << " seg  "
            << humanize(static_cast<int64_t>(stats.bytesPerSecond())) << "/s";

        const double eta = stats.etaSeconds();
        if (eta >= 0.0) {
            oss << "  ETA " << static_cast<int64_t>(eta) << "s";
        }

        std::lock_guard<std::mutex> lock(mutex_);
        // 同一行を上書きして表示（\r で行頭に戻る）
        std::cout << "\r" << oss.str() << "    " << std::flush;
    }

    // -------------------------------------------------------------------------
    // エラー通知
    // -------------------------------------------------------------------------
    void onError(JobId id, const Status& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "\n";
        SEGDL_LOG_ERROR(TAG, "job " << id << " >>> " << error.toString() << " <<<");
    }

    JobState lastState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

private:
    /// バイト数を人間が読みやすい形式に変換
    static std::string humanize(int64_t bytes) {
        if (bytes < 0)           return "?";
        if (bytes < 1024)        return std::to_string(bytes) + " B";
        if (bytes < 1024 * 1024) return std::to_string(bytes / 1024) + " KB";
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }

    mutable std::mutex mutex_;
    JobState           last_{JobState::QUEUED};
};

/// コマンドライン引数
struct Options {
    std::string url;
    std::string dir = ".";
    std::string controlSocket;
    bool        multi     = false;
    bool        force     = false;
    bool        overwrite = false;
    bool        verbose   = false;
};

void printUsage() {
    std::cerr << "Usage: segdl <url> [dir] [--multi] [--force] [--overwrite]"
                 " [--control <socket>] [--verbose]\n";
}

bool parseArgs(int argc, char* argv[], Options& out) {
    bool haveDir = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--multi") {
            out.multi = true;
        } else if (arg == "--force") {
            out.force = true;
        } else if (arg == "--overwrite") {
            out.overwrite = true;
        } else if (arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "--control") {
            if (i + 1 >= argc) return false;
            out.controlSocket = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else if (out.url.empty()) {
            out.url = arg;
        } else if (!haveDir) {
            out.dir = arg;
            haveDir = true;
        } else {
            return false;
        }
    }
    return !out.url.empty();
}

int exitCodeFor(JobState state) {
    switch (state) {
        case JobState::COMPLETED: return 0;
        case JobState::PAUSED:    return 2;
        default:                  return 1;
    }
}

} // namespace

// =============================================================================
// main
// =============================================================================
int main(int argc, char* argv[]) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 64;
    }
    if (options.verbose) {
        Logger::instance().setLevel(LogLevel::DEBUG);
    }

    EngineConfig config;
    config.backend      = options.multi ? BackendKind::MULTIPLEXED : BackendKind::THREADED;
    config.forceRestart = options.force;
    config.overwrite    = options.overwrite;
    config.downloadDir  = options.dir;

    MemoryJobStore   store;
    ConnectionBudget budget(config.maxTotalConnections, config.maxConnectionsPerHost);
    JobControl       control(&store);
    HostPolicy       hostPolicy;

    ControlServer controlServer(control);
    if (!options.controlSocket.empty()) {
        try {
            controlServer.start(options.controlSocket);
        } catch (const std::system_error& e) {
            SEGDL_LOG_ERROR(TAG, "control socket unavailable: " << e.what());
            return 1;
        }
    }

    Scheduler scheduler(config, store, budget, control, &hostPolicy);
    ConsoleObserver observer;
    scheduler.addObserver(&observer);

    JobSettings settings;
    settings.overwrite = options.overwrite;
    const JobId id = store.addJob(options.url, settings);

    SEGDL_LOG_INFO(TAG, "job " << id << ": " << options.url << " -> " << options.dir
                   << " (" << (options.multi ? "multiplexed" : "threaded") << ")");

    const auto state = scheduler.runNext();
    scheduler.removeObserver(&observer);
    controlServer.stop();

    if (!state) {
        SEGDL_LOG_ERROR(TAG, "job " << id << " was not claimed");
        return 1;
    }

    const Job job = store.get(id);
    if (*state == JobState::COMPLETED && job.metadata.finalFilename) {
        SEGDL_LOG_INFO(TAG, "saved " << *job.metadata.finalFilename);
    }
    return exitCodeFor(*state);
}
