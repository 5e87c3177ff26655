/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file FileTransfer.h
 * @brief Single-entry filesystem primitives used by the operation workers
 *
 * All functions report failures through TransferResult and never throw for I/O
 * errors. Content copies go through a uniquely named temporary sibling of the
 * destination that is published with rename(), so a destination path either keeps
 * its previous content or holds the complete new content.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "FileOpError.h"
#include "../Concurrency/CancellationToken.h"

namespace TwinPane::Core::IO {

enum class TransferStatus {
    Completed,
    Failed,
    Cancelled
};

struct TransferResult {
    TransferStatus status = TransferStatus::Completed;
    uint64_t bytes = 0;
    FileOpErrorInfo error;

    bool ok() const noexcept { return status == TransferStatus::Completed; }
    bool cancelled() const noexcept { return status == TransferStatus::Cancelled; }

    // Failure was EXDEV from rename(); the caller can fall back to copy + remove
    bool crossDevice() const noexcept;

    static TransferResult success(uint64_t bytes = 0) { return {TransferStatus::Completed, bytes, {}}; }
    static TransferResult failure(FileOpErrorInfo error) { return {TransferStatus::Failed, 0, std::move(error)}; }
    static TransferResult cancellation(uint64_t bytes = 0) { return {TransferStatus::Cancelled, bytes, {}}; }
};

struct TransferOptions {
    size_t chunkSize = 1024 * 1024;
    bool preserveAttributes = true;
    bool replaceExisting = false;   ///< Publish over an existing destination
};

// Receives the running byte count after every chunk
using TransferProgress = std::function<void(uint64_t bytesSoFar)>;

/**
 * @brief Copies a regular file's content
 *
 * Streams src into a temporary sibling of dst in chunks of options.chunkSize,
 * reporting progress and checking the token after every chunk. The byte count must
 * equal expectedSize (IntegrityMismatch otherwise). Modification time and permission
 * bits are carried over when options.preserveAttributes is set. On success the
 * temporary is renamed onto dst; on failure or cancellation it is removed and dst is
 * left untouched.
 */
TransferResult copyFileContents(const std::filesystem::path& src,
                                const std::filesystem::path& dst,
                                uint64_t expectedSize,
                                const TransferOptions& options,
                                const TransferProgress& progress,
                                const Concurrency::CancellationToken& cancel);

// Re-creates the symbolic link src at dst (the link, not its target)
TransferResult copySymlink(const std::filesystem::path& src, const std::filesystem::path& dst, bool replaceExisting);

/**
 * @brief Atomic same-volume rename
 *
 * Without replaceExisting an occupied dst fails with AlreadyExists. Cross-device
 * renames fail with crossDevice() set.
 */
TransferResult renameEntry(const std::filesystem::path& src, const std::filesystem::path& dst, bool replaceExisting);

/**
 * @brief Removes one file, link or empty directory and verifies it is gone
 *
 * A missing entry fails with NotFound; a directory with content fails with
 * DirectoryNotEmpty.
 */
TransferResult removeEntry(const std::filesystem::path& path, bool isDirectory);

// mkdir of a single level; AlreadyExists when anything occupies the path
TransferResult createDirectoryEntry(const std::filesystem::path& path);

/**
 * @brief Creates an empty, uniquely named file next to the target
 *
 * The name is derived from base and is hidden on POSIX systems. The returned path is
 * empty when creation failed; ec then holds the reason.
 */
std::filesystem::path createSecureTempPath(const std::filesystem::path& dir, const std::string& base,
                                           std::error_code& ec);

/**
 * @brief Entry-level operations a FileOperationsManager worker performs
 *
 * The manager talks to the filesystem only through this interface.
 * LocalTransferBackend forwards to the functions above; other backends can wrap it to
 * observe or alter individual calls.
 */
class ITransferBackend {
public:
    virtual ~ITransferBackend() = default;

    virtual TransferResult copyFile(const std::filesystem::path& src, const std::filesystem::path& dst,
                                    uint64_t expectedSize, const TransferOptions& options,
                                    const TransferProgress& progress,
                                    const Concurrency::CancellationToken& cancel) = 0;
    virtual TransferResult copyLink(const std::filesystem::path& src, const std::filesystem::path& dst,
                                    bool replaceExisting) = 0;
    virtual TransferResult rename(const std::filesystem::path& src, const std::filesystem::path& dst,
                                  bool replaceExisting) = 0;
    virtual TransferResult remove(const std::filesystem::path& path, bool isDirectory) = 0;
    virtual TransferResult createDirectory(const std::filesystem::path& path) = 0;
    virtual bool sameVolume(const std::filesystem::path& a, const std::filesystem::path& b) = 0;
};

class LocalTransferBackend : public ITransferBackend {
public:
    TransferResult copyFile(const std::filesystem::path& src, const std::filesystem::path& dst,
                            uint64_t expectedSize, const TransferOptions& options,
                            const TransferProgress& progress,
                            const Concurrency::CancellationToken& cancel) override;
    TransferResult copyLink(const std::filesystem::path& src, const std::filesystem::path& dst,
                            bool replaceExisting) override;
    TransferResult rename(const std::filesystem::path& src, const std::filesystem::path& dst,
                          bool replaceExisting) override;
    TransferResult remove(const std::filesystem::path& path, bool isDirectory) override;
    TransferResult createDirectory(const std::filesystem::path& path) override;
    bool sameVolume(const std::filesystem::path& a, const std::filesystem::path& b) override;
};

} // namespace TwinPane::Core::IO
