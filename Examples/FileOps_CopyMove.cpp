#include "TwinPaneCore.h"
#include <filesystem>
#include <format>
#include <fstream>
#include <string>

using namespace TwinPane::Core;
using namespace TwinPane::Core::Concurrency;
using namespace TwinPane::Core::IO;

static std::filesystem::path tempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

static void writeFile(const std::filesystem::path& p, size_t bytes, char fill) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << std::string(bytes, fill);
}

int main() {
    WorkService svc({});
    WorkContractGroup group(128, "FileOps_CopyMove");
    svc.start();
    svc.addWorkContractGroup(&group);

    FileOperationsManager manager(&group, FileOperationsManager::Config::fromEnvironment());

    namespace fs = std::filesystem;
    const auto left = tempPath("twinpane_left");
    const auto right = tempPath("twinpane_right");
    fs::remove_all(left);
    fs::remove_all(right);
    fs::create_directories(left / "photos");
    writeFile(left / "notes.txt", 4096, 'A');
    writeFile(left / "photos" / "beach.jpg", 3 * 1024 * 1024, 'B');

    std::vector<FileItem> selection;
    for (const auto& name : {"notes.txt", "photos"}) {
        if (auto item = FileItem::fromPath(left / name)) selection.push_back(*item);
    }

    ProgressSink sink;
    sink.onProgress = [](const OperationItem& item, uint64_t bytes, uint64_t total) {
        TWINPANE_LOG_INFO(std::format("{}: {} / {}", item.sourcePath().filename().string(),
                                      formatFileSize(bytes), formatFileSize(total)));
    };
    sink.onBatchProgress = [](const BatchProgress& p) {
        TWINPANE_LOG_DEBUG(std::format("{:.0f}% of items, {:.0f}% of bytes", p.itemPercent(), p.bytePercent()));
    };

    auto copied = manager.copyItems(selection, right, ConflictResolver::rename(), sink);
    DefaultLabelLookup labels;
    for (const auto& item : copied.items) {
        TWINPANE_LOG_INFO(labels.describe(item));
    }

    // Copying again collides with everything; the rename strategy picks "name (1)"
    auto again = manager.copyItems(selection, right, ConflictResolver::rename(), sink);
    for (const auto& item : again.items) {
        TWINPANE_LOG_INFO(std::format("Second copy -> {}", item.destinationPath().string()));
    }

    const auto archive = tempPath("twinpane_archive");
    fs::remove_all(archive);
    std::vector<FileItem> toMove;
    for (const auto& entry : fs::directory_iterator(right)) {
        if (auto item = FileItem::fromPath(entry.path())) toMove.push_back(*item);
    }
    auto moved = manager.moveItems(toMove, archive, ConflictResolver::overwrite());
    TWINPANE_LOG_INFO(std::format("Moved {} of {} item(s)", moved.count(OperationState::Completed), moved.items.size()));

    std::vector<FileItem> cleanup;
    for (const auto& dir : {left, archive}) {
        if (auto item = FileItem::fromPath(dir)) cleanup.push_back(*item);
    }
    auto deleted = manager.deleteItems(cleanup);
    TWINPANE_LOG_INFO(std::format("Deleted {} entries", deleted.count(OperationState::Completed)));

    fs::remove_all(right);
    svc.stop();
    return deleted.allCompleted() ? 0 : 1;
}
