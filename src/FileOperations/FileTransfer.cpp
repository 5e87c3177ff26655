/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "FileTransfer.h"
#include "PathUtils.h"
#include "../Logging/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <format>
#include <random>
#include <string_view>
#include <vector>

#include <fcntl.h>     // open(), AT_FDCWD
#include <sys/stat.h>  // fstat(), fchmod(), futimens(), mkdir()
#include <unistd.h>    // read(), write(), close(), unlink(), rmdir()

namespace TwinPane::Core::IO {

namespace {

    FileOpErrorInfo errnoError(int err, std::string message, const std::filesystem::path& p) {
        return errorFromCode(std::error_code(err, std::generic_category()), std::move(message), p.string());
    }

    // Owns a POSIX descriptor
    class FileDescriptor {
    public:
        explicit FileDescriptor(int fd) noexcept : _fd(fd) {}
        ~FileDescriptor() {
            if (_fd >= 0) ::close(_fd);
        }
        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int get() const noexcept { return _fd; }
        explicit operator bool() const noexcept { return _fd >= 0; }

        // Closes now so that deferred write errors (NFS, quotas) are observed
        int close() noexcept {
            const int fd = _fd;
            _fd = -1;
            return fd >= 0 ? ::close(fd) : 0;
        }

    private:
        int _fd = -1;
    };

    // Removes a temporary path on scope exit unless released
    class TempFileGuard {
    public:
        explicit TempFileGuard(std::filesystem::path p) : _path(std::move(p)) {}
        ~TempFileGuard() {
            if (!_path.empty()) {
                std::error_code ec;
                std::filesystem::remove(_path, ec);  // best-effort cleanup
            }
        }
        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;

        void release() noexcept { _path.clear(); }

    private:
        std::filesystem::path _path;
    };

    ssize_t readSome(int fd, char* buffer, size_t size) {
        for (;;) {
            const ssize_t n = ::read(fd, buffer, size);
            if (n >= 0 || errno != EINTR) return n;
        }
    }

    bool writeAll(int fd, const char* data, size_t size) {
        while (size > 0) {
            const ssize_t n = ::write(fd, data, size);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            size -= static_cast<size_t>(n);
        }
        return true;
    }

    void applyAttributes(int fd, const struct stat& source, bool preserve, const std::filesystem::path& dst) {
        const mode_t mode = preserve ? static_cast<mode_t>(source.st_mode & 07777) : static_cast<mode_t>(0644);
        if (::fchmod(fd, mode) != 0) {
            TWINPANE_LOG_DEBUG_CAT("FileOperations",
                std::format("Could not set permissions on {}: errno {}", dst.string(), errno));
        }
        if (!preserve) return;

        struct timespec times[2];
#if defined(__APPLE__)
        times[0] = source.st_atimespec;
        times[1] = source.st_mtimespec;
#else
        times[0] = source.st_atim;
        times[1] = source.st_mtim;
#endif
        if (::futimens(fd, times) != 0) {
            TWINPANE_LOG_DEBUG_CAT("FileOperations",
                std::format("Could not preserve times on {}: errno {}", dst.string(), errno));
        }
    }

    std::filesystem::path randomSibling(const std::filesystem::path& dst, std::string_view tag) {
        std::random_device rd;
        return dst.parent_path() / std::format(".{}.{}{:08x}", dst.filename().string(), tag, rd());
    }

} // namespace

bool TransferResult::crossDevice() const noexcept {
    return status == TransferStatus::Failed && error.systemError &&
           *error.systemError == std::error_code(EXDEV, std::generic_category());
}

std::filesystem::path createSecureTempPath(const std::filesystem::path& dir, const std::string& base,
                                           std::error_code& ec) {
    ec.clear();
    std::string tmpl = (dir / (base + ".XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        ec = std::error_code(errno, std::generic_category());
        return {};
    }
    ::close(fd);  // reopened by the writer
    return std::filesystem::path(buf.data());
}

TransferResult copyFileContents(const std::filesystem::path& src,
                                const std::filesystem::path& dst,
                                uint64_t expectedSize,
                                const TransferOptions& options,
                                const TransferProgress& progress,
                                const Concurrency::CancellationToken& cancel) {
    if (cancel.isCancellationRequested()) {
        return TransferResult::cancellation();
    }

    FileDescriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in) {
        return TransferResult::failure(errnoError(errno, "Cannot open source", src));
    }

    struct stat srcStat{};
    if (::fstat(in.get(), &srcStat) != 0) {
        return TransferResult::failure(errnoError(errno, "Cannot stat source", src));
    }
    if (!S_ISREG(srcStat.st_mode)) {
        return TransferResult::failure(makeError(FileOpError::TypeMismatch, "Source is not a regular file", src.string()));
    }

    std::error_code ec;
    const auto tempPath = createSecureTempPath(dst.parent_path(), "." + dst.filename().string(), ec);
    if (tempPath.empty()) {
        return TransferResult::failure(errorFromCode(ec, "Cannot create temporary file", dst.string()));
    }
    TempFileGuard guard(tempPath);

    FileDescriptor out(::open(tempPath.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC));
    if (!out) {
        return TransferResult::failure(errnoError(errno, "Cannot open temporary file", tempPath));
    }

    std::vector<char> buffer(std::max<size_t>(options.chunkSize, 1));
    uint64_t total = 0;

    while (true) {
        const ssize_t n = readSome(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            return TransferResult::failure(errnoError(errno, "Read failed", src));
        }
        if (n == 0) {
            break;
        }
        if (!writeAll(out.get(), buffer.data(), static_cast<size_t>(n))) {
            return TransferResult::failure(errnoError(errno, "Write failed", dst));
        }
        total += static_cast<uint64_t>(n);

        if (progress) {
            progress(total);
        }
        if (cancel.isCancellationRequested()) {
            return TransferResult::cancellation(total);
        }
        if (total > expectedSize) {
            // Source grew since it was planned
            break;
        }
    }

    if (total != expectedSize) {
        return TransferResult::failure(makeError(FileOpError::IntegrityMismatch,
            std::format("Copied {} bytes, expected {}", total, expectedSize), src.string()));
    }

    applyAttributes(out.get(), srcStat, options.preserveAttributes, dst);

    if (out.close() != 0) {
        return TransferResult::failure(errnoError(errno, "Closing destination failed", dst));
    }

    struct stat written{};
    if (::stat(tempPath.c_str(), &written) != 0) {
        return TransferResult::failure(errnoError(errno, "Cannot verify destination", tempPath));
    }
    if (static_cast<uint64_t>(written.st_size) != expectedSize) {
        return TransferResult::failure(makeError(FileOpError::IntegrityMismatch,
            std::format("Destination holds {} bytes, expected {}", written.st_size, expectedSize), dst.string()));
    }

    auto published = renameEntry(tempPath, dst, options.replaceExisting);
    if (!published.ok()) {
        return published;
    }

    guard.release();
    return TransferResult::success(total);
}

TransferResult copySymlink(const std::filesystem::path& src, const std::filesystem::path& dst, bool replaceExisting) {
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(src, ec);
    if (ec) {
        return TransferResult::failure(errorFromCode(ec, "Cannot read link", src.string()));
    }

    const auto tempLink = randomSibling(dst, "lnk");
    std::filesystem::create_symlink(target, tempLink, ec);
    if (ec) {
        return TransferResult::failure(errorFromCode(ec, "Cannot create link", dst.string()));
    }
    TempFileGuard guard(tempLink);

    auto published = renameEntry(tempLink, dst, replaceExisting);
    if (!published.ok()) {
        return published;
    }
    guard.release();
    return TransferResult::success();
}

TransferResult renameEntry(const std::filesystem::path& src, const std::filesystem::path& dst, bool replaceExisting) {
    if (replaceExisting) {
        if (::rename(src.c_str(), dst.c_str()) != 0) {
            return TransferResult::failure(errnoError(errno, "Rename failed", src));
        }
        return TransferResult::success();
    }

#if defined(__linux__) && defined(RENAME_NOREPLACE)
    if (::renameat2(AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0) {
        return TransferResult::success();
    }
    const int err = errno;
    // EINVAL/ENOSYS: the filesystem does not support the flag, retry below
    if (err != EINVAL && err != ENOSYS) {
        if (err == EEXIST) {
            return TransferResult::failure(errnoError(err, "Destination already exists", dst));
        }
        return TransferResult::failure(errnoError(err, "Rename failed", src));
    }
#endif

    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(dst, ec))) {
        return TransferResult::failure(makeError(FileOpError::AlreadyExists, "Destination already exists", dst.string(),
                                                 std::error_code(EEXIST, std::generic_category())));
    }
    if (::rename(src.c_str(), dst.c_str()) != 0) {
        return TransferResult::failure(errnoError(errno, "Rename failed", src));
    }
    return TransferResult::success();
}

TransferResult removeEntry(const std::filesystem::path& path, bool isDirectory) {
    const int rc = isDirectory ? ::rmdir(path.c_str()) : ::unlink(path.c_str());
    if (rc != 0) {
        int err = errno;
        // POSIX allows EEXIST for a non-empty directory
        if (isDirectory && err == EEXIST) err = ENOTEMPTY;
        return TransferResult::failure(errnoError(err, "Remove failed", path));
    }

    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        return TransferResult::failure(makeError(FileOpError::IOError, "Entry still present after removal", path.string()));
    }
    return TransferResult::success();
}

TransferResult createDirectoryEntry(const std::filesystem::path& path) {
    if (::mkdir(path.c_str(), 0777) != 0) {
        return TransferResult::failure(errnoError(errno, "Cannot create directory", path));
    }
    return TransferResult::success();
}

TransferResult LocalTransferBackend::copyFile(const std::filesystem::path& src, const std::filesystem::path& dst,
                                             uint64_t expectedSize, const TransferOptions& options,
                                             const TransferProgress& progress,
                                             const Concurrency::CancellationToken& cancel) {
    return copyFileContents(src, dst, expectedSize, options, progress, cancel);
}

TransferResult LocalTransferBackend::copyLink(const std::filesystem::path& src, const std::filesystem::path& dst,
                                             bool replaceExisting) {
    return copySymlink(src, dst, replaceExisting);
}

TransferResult LocalTransferBackend::rename(const std::filesystem::path& src, const std::filesystem::path& dst,
                                           bool replaceExisting) {
    return renameEntry(src, dst, replaceExisting);
}

TransferResult LocalTransferBackend::remove(const std::filesystem::path& path, bool isDirectory) {
    return removeEntry(path, isDirectory);
}

TransferResult LocalTransferBackend::createDirectory(const std::filesystem::path& path) {
    return createDirectoryEntry(path);
}

bool LocalTransferBackend::sameVolume(const std::filesystem::path& a, const std::filesystem::path& b) {
    return isSameVolume(a, b);
}

} // namespace TwinPane::Core::IO
