#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

#include "Logging/ConsoleSink.h"
#include "Logging/Logger.h"

using namespace TwinPane::Core::Logging;

namespace {

class CollectingSink : public ILogSink {
public:
    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        entries.push_back(entry);
    }
    void flush() override { ++flushes; }

    std::vector<LogEntry> entries;
    int flushes = 0;

private:
    std::mutex _mutex;
};

} // namespace

TEST(Logger, DeliversEntriesAtOrAboveMinimumLevel) {
    Logger logger("Test");
    auto sink = std::make_shared<CollectingSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Info);

    logger.log(LogLevel::Debug, "Cat", "hidden");
    logger.log(LogLevel::Info, "Cat", "shown");
    logger.log(LogLevel::Error, "FileOperations", "failed");

    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].message, "shown");
    EXPECT_EQ(sink->entries[1].category, "FileOperations");
    EXPECT_EQ(sink->entries[1].level, LogLevel::Error);
    EXPECT_GE(sink->flushes, 1);
}

TEST(Logger, SinkLevelFiltersIndependently) {
    Logger logger("Test");
    auto everything = std::make_shared<CollectingSink>();
    auto errorsOnly = std::make_shared<CollectingSink>();
    errorsOnly->setMinLevel(LogLevel::Error);
    logger.addSink(everything);
    logger.addSink(errorsOnly);
    logger.setMinLevel(LogLevel::Trace);

    logger.log(LogLevel::Trace, "c", "t");
    logger.log(LogLevel::Warning, "c", "w");
    logger.log(LogLevel::Fatal, "c", "f");

    EXPECT_EQ(everything->entries.size(), 3u);
    EXPECT_EQ(errorsOnly->entries.size(), 1u);

    EXPECT_TRUE(logger.removeSink(errorsOnly));
    EXPECT_FALSE(logger.removeSink(errorsOnly));
    EXPECT_EQ(logger.sinkCount(), 1u);
    logger.clearSinks();
    EXPECT_EQ(logger.sinkCount(), 0u);
}

TEST(Logger, OffDisablesEverything) {
    Logger logger("Test");
    logger.setMinLevel(LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Fatal));
    logger.setMinLevel(LogLevel::Warning);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info));
}

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("none"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
    EXPECT_EQ(logLevelToString(LogLevel::Error), "ERROR");
}

TEST(ConsoleSink, FormatsLevelCategoryAndMessage) {
    std::ostringstream out;
    auto sink = std::make_shared<ConsoleSink>(out);
    Logger logger("Test");
    logger.addSink(sink);

    logger.log(LogLevel::Warning, "FileOperations", "disk almost full");

    const auto line = out.str();
    EXPECT_NE(line.find("[WARN]"), std::string::npos);
    EXPECT_NE(line.find("[FileOperations]"), std::string::npos);
    EXPECT_NE(line.find("disk almost full"), std::string::npos);
}

TEST(Logger, MacrosRouteThroughGlobalLogger) {
    auto sink = std::make_shared<CollectingSink>();
    auto& global = Logger::global();
    const auto previous = global.minLevel();
    global.addSink(sink);
    global.setMinLevel(LogLevel::Debug);

    TWINPANE_LOG_DEBUG_CAT("FileOperations", "from macro");
    TWINPANE_LOG_TRACE("filtered");

    global.removeSink(sink);
    global.setMinLevel(previous);

    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_EQ(sink->entries[0].message, "from macro");
    EXPECT_EQ(sink->entries[0].category, "FileOperations");
}
