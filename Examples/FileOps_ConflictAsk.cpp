#include "TwinPaneCore.h"
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>

using namespace TwinPane::Core;
using namespace TwinPane::Core::Concurrency;
using namespace TwinPane::Core::IO;

namespace fs = std::filesystem;

static void writeFile(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

int main(int argc, char** argv) {
    // Pass --interactive to answer on stdin; otherwise every conflict is renamed
    const bool interactive = argc > 1 && std::string(argv[1]) == "--interactive";

    WorkService svc({});
    WorkContractGroup group(64, "FileOps_ConflictAsk");
    svc.start();
    svc.addWorkContractGroup(&group);
    FileOperationsManager manager(&group);

    const auto base = fs::temp_directory_path() / "twinpane_conflict_demo";
    fs::remove_all(base);
    fs::create_directories(base / "src");
    fs::create_directories(base / "dst");
    for (int i = 0; i < 3; ++i) {
        const auto name = std::format("report{}.txt", i);
        writeFile(base / "src" / name, std::format("new contents {}", i));
        writeFile(base / "dst" / name, "old");
    }

    auto resolver = ConflictResolver::ask([interactive](const OperationItem& item, const FileItem& existing) {
        if (!interactive) {
            return ConflictDecision::rename({});
        }
        std::cout << std::format("{} exists ({}, modified {}). [o]verwrite, [s]kip, [r]ename, [a]ll overwrite? ",
                                 item.destinationPath().string(), existing.formatSize(), existing.formatModifiedTime());
        std::string answer;
        std::getline(std::cin, answer);
        switch (answer.empty() ? 's' : answer.front()) {
            case 'o': return ConflictDecision::overwrite();
            case 'r': return ConflictDecision::rename({});
            case 'a': return ConflictDecision::overwrite(true);
            default: return ConflictDecision::skip();
        }
    });

    std::vector<FileItem> selection;
    for (const auto& entry : fs::directory_iterator(base / "src")) {
        if (auto item = FileItem::fromPath(entry.path())) selection.push_back(*item);
    }

    auto result = manager.copyItems(selection, base / "dst", resolver);
    DefaultLabelLookup labels;
    for (const auto& item : result.items) {
        TWINPANE_LOG_INFO(labels.describe(item));
    }

    fs::remove_all(base);
    svc.stop();
    return result.count(OperationState::Failed) == 0 ? 0 : 1;
}
