// =============================================================================
// StorageWriter.cpp
// POSIX ファイル API による一時ファイル管理
// =============================================================================

#include "StorageWriter.h"
#include "Log.h"

#include <cerrno>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace SegmentedDownloader {

namespace fs = std::filesystem;

namespace {

constexpr const char* TAG = "Storage";

[[noreturn]] void throwErrno(int err, const std::string& what) {
    throw std::system_error(err, std::generic_category(), what);
}

int openOrThrow(const fs::path& path, int flags) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throwErrno(errno, "open " + path.string());
    }
    return fd;
}

} // namespace

// -----------------------------------------------------------------------------
// 生成
// -----------------------------------------------------------------------------

StorageWriter::StorageWriter(Passkey, fs::path tempPath, int fd)
    : tempPath_(std::move(tempPath)), fd_(fd) {}

std::unique_ptr<StorageWriter> StorageWriter::create(const fs::path& tempPath) {
    const int fd = openOrThrow(tempPath, O_RDWR | O_CREAT | O_TRUNC);
    return std::make_unique<StorageWriter>(Passkey{}, tempPath, fd);
}

std::unique_ptr<StorageWriter> StorageWriter::openExisting(const fs::path& tempPath) {
    const int fd = openOrThrow(tempPath, O_RDWR);
    return std::make_unique<StorageWriter>(Passkey{}, tempPath, fd);
}

fs::path StorageWriter::tempPathFor(const fs::path& finalPath) {
    fs::path temp = finalPath;
    temp += ".part";
    return temp;
}

StorageWriter::~StorageWriter() {
    std::unique_lock<std::shared_mutex> lock(ioMutex_);
    closeLocked();
}

// -----------------------------------------------------------------------------
// 事前確保
// -----------------------------------------------------------------------------

PreallocationMode StorageWriter::preallocate(int64_t size) {
    std::unique_lock<std::shared_mutex> lock(ioMutex_);
    if (fd_ < 0) throwErrno(EBADF, "preallocate " + tempPath_.string());

    // posix_fallocate は errno ではなく戻り値でエラーを返す
    const int rc = ::posix_fallocate(fd_, 0, static_cast<off_t>(size));
    if (rc == 0) {
        return PreallocationMode::FALLOCATE;
    }
    SEGDL_LOG_DEBUG(TAG, "posix_fallocate failed (" << rc
                         << "), falling back to ftruncate");

    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throwErrno(errno, "ftruncate " + tempPath_.string());
    }
    return PreallocationMode::TRUNCATE;
}

// -----------------------------------------------------------------------------
// 書き込み
// -----------------------------------------------------------------------------

void StorageWriter::writeAt(int64_t offset, const char* data, size_t size) {
    std::shared_lock<std::shared_mutex> lock(ioMutex_);
    if (fd_ < 0) throwErrno(EBADF, "write " + tempPath_.string());

    size_t done = 0;
    while (done < size) {
        const ssize_t n = ::pwrite(fd_, data + done, size - done,
                                   static_cast<off_t>(offset + static_cast<int64_t>(done)));
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno(errno, "pwrite " + tempPath_.string());
        }
        if (n == 0) {
            throwErrno(EIO, "pwrite wrote zero bytes to " + tempPath_.string());
        }
        done += static_cast<size_t>(n);
    }
}

void StorageWriter::sync() {
    std::unique_lock<std::shared_mutex> lock(ioMutex_);
    if (fd_ < 0) throwErrno(EBADF, "fsync " + tempPath_.string());
    if (::fsync(fd_) != 0) {
        throwErrno(errno, "fsync " + tempPath_.string());
    }
}

// -----------------------------------------------------------------------------
// 確定
// -----------------------------------------------------------------------------

void StorageWriter::finalize(const fs::path& finalPath, bool overwrite) {
    std::unique_lock<std::shared_mutex> lock(ioMutex_);
    if (fd_ < 0) throwErrno(EBADF, "finalize " + tempPath_.string());

    if (::fsync(fd_) != 0) {
        throwErrno(errno, "fsync " + tempPath_.string());
    }
    closeLocked();

    if (overwrite) {
        if (::rename(tempPath_.c_str(), finalPath.c_str()) != 0) {
            throwErrno(errno, "rename to " + finalPath.string());
        }
        return;
    }

    // link() は宛先が存在すると EEXIST で失敗するため、上書き禁止をアトミックに判定できる
    if (::link(tempPath_.c_str(), finalPath.c_str()) == 0) {
        if (::unlink(tempPath_.c_str()) != 0) {
            throwErrno(errno, "unlink " + tempPath_.string());
        }
        return;
    }

    const int err = errno;
    if (err != EPERM && err != EOPNOTSUPP && err != EXDEV) {
        throwErrno(err, "link to " + finalPath.string());
    }

    // ハードリンク非対応 FS: 存在確認 + rename
    struct stat st{};
    if (::stat(finalPath.c_str(), &st) == 0) {
        throwErrno(EEXIST, "destination exists: " + finalPath.string());
    }
    if (::rename(tempPath_.c_str(), finalPath.c_str()) != 0) {
        throwErrno(errno, "rename to " + finalPath.string());
    }
}

void StorageWriter::close() {
    std::unique_lock<std::shared_mutex> lock(ioMutex_);
    closeLocked();
}

void StorageWriter::closeLocked() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            SEGDL_LOG_WARN(TAG, "close " << tempPath_.string()
                                << " failed: errno " << errno);
        }
        fd_ = -1;
    }
}

// -----------------------------------------------------------------------------
// 状態取得
// -----------------------------------------------------------------------------

int64_t StorageWriter::size() const {
    std::shared_lock<std::shared_mutex> lock(ioMutex_);
    if (fd_ < 0) throwErrno(EBADF, "fstat " + tempPath_.string());
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        throwErrno(errno, "fstat " + tempPath_.string());
    }
    return static_cast<int64_t>(st.st_size);
}

bool StorageWriter::isOpen() const {
    std::shared_lock<std::shared_mutex> lock(ioMutex_);
    return fd_ >= 0;
}

} // namespace SegmentedDownloader
