#include "FileOpsTestHelpers.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <stdlib.h>

namespace twinpane::test_helpers {

using namespace TwinPane::Core::IO;

ScopedTempDir::ScopedTempDir() {
    namespace fs = std::filesystem;
    std::string pattern = (fs::temp_directory_path() / "twinpane-test-XXXXXX").string();
    if (!::mkdtemp(pattern.data())) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
    }
    // Canonical so paths compare equal to what the engine normalizes
    _path = fs::canonical(pattern);
}

ScopedTempDir::~ScopedTempDir() {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::permissions(_path, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(_path, ec);
}

RecordingSink::RecordingSink() {
    _sink.onProgress = [this](const OperationItem& item, uint64_t bytes, uint64_t) {
        std::lock_guard<std::mutex> lock(_mutex);
        _progress.emplace_back(item.sourcePath(), bytes);
    };
    _sink.onItemTerminal = [this](const OperationItem& item) {
        std::lock_guard<std::mutex> lock(_mutex);
        _terminal.push_back(item);
    };
    _sink.onScanProgress = [this](size_t, uint64_t) {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_scans;
    };
}

std::vector<OperationItem> RecordingSink::terminalItems() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _terminal;
}

size_t RecordingSink::progressEvents() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _progress.size();
}

size_t RecordingSink::scanEvents() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _scans;
}

std::vector<uint64_t> RecordingSink::progressBytesFor(const std::filesystem::path& source) const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<uint64_t> out;
    const auto wanted = normalizePath(source);
    for (const auto& [path, bytes] : _progress) {
        if (path == wanted) out.push_back(bytes);
    }
    return out;
}

void writeFile(const std::filesystem::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readAllBytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

FileItem itemFor(const std::filesystem::path& p) {
    auto item = FileItem::fromPath(p);
    if (!item) throw std::runtime_error("missing test fixture: " + p.string());
    return *item;
}

std::vector<std::filesystem::path> listNames(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace twinpane::test_helpers
