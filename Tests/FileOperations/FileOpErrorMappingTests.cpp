#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

#include "FileOperations/FileOpError.h"
#include "FileOperations/LabelLookup.h"

using namespace TwinPane::Core::IO;

TEST(FileOpErrorMapping, ErrnoValuesMapToTaxonomy) {
    EXPECT_EQ(mapErrnoToFileOpError(0), FileOpError::None);
    EXPECT_EQ(mapErrnoToFileOpError(ENOSPC), FileOpError::DiskFull);
    EXPECT_EQ(mapErrnoToFileOpError(EDQUOT), FileOpError::DiskFull);
    EXPECT_EQ(mapErrnoToFileOpError(EACCES), FileOpError::PermissionDenied);
    EXPECT_EQ(mapErrnoToFileOpError(EPERM), FileOpError::PermissionDenied);
    EXPECT_EQ(mapErrnoToFileOpError(ENOENT), FileOpError::NotFound);
    EXPECT_EQ(mapErrnoToFileOpError(ENAMETOOLONG), FileOpError::PathTooLong);
    EXPECT_EQ(mapErrnoToFileOpError(EEXIST), FileOpError::AlreadyExists);
    EXPECT_EQ(mapErrnoToFileOpError(ENOTEMPTY), FileOpError::DirectoryNotEmpty);
    EXPECT_EQ(mapErrnoToFileOpError(EISDIR), FileOpError::TypeMismatch);
    EXPECT_EQ(mapErrnoToFileOpError(EIO), FileOpError::IOError);
}

TEST(FileOpErrorMapping, ErrorCodesOfBothCategoriesMap) {
    EXPECT_EQ(mapErrorCode(std::make_error_code(std::errc::no_space_on_device)), FileOpError::DiskFull);
    EXPECT_EQ(mapErrorCode(std::error_code(ENOENT, std::system_category())), FileOpError::NotFound);
    EXPECT_EQ(mapErrorCode(std::error_code()), FileOpError::None);
}

TEST(FileOpErrorMapping, ErrorFromCodeKeepsSystemDetail) {
    auto info = errorFromCode(std::make_error_code(std::errc::permission_denied), "Cannot open", "/x");
    EXPECT_EQ(info.code, FileOpError::PermissionDenied);
    EXPECT_EQ(info.path, "/x");
    EXPECT_NE(info.message.find("Cannot open"), std::string::npos);
    ASSERT_TRUE(info.systemError.has_value());
    EXPECT_TRUE(static_cast<bool>(info));
}

TEST(FileOpErrorMapping, DefaultInfoIsNoError) {
    FileOpErrorInfo info;
    EXPECT_FALSE(static_cast<bool>(info));
    EXPECT_EQ(toString(FileOpError::IntegrityMismatch), "IntegrityMismatch");
}

TEST(LabelLookup, DescribesItemsForDisplay) {
    DefaultLabelLookup labels;
    OperationItem item(OperationKind::Move, "/a", "/b", 1);
    EXPECT_EQ(labels.describe(item), "Move: Waiting");

    item.start();
    item.fail(makeError(FileOpError::DiskFull, "full"));
    EXPECT_EQ(labels.describe(item), "Move: Failed (Disk is full)");

    const ILabelLookup& lookup = labels;
    EXPECT_EQ(lookup.label(ConflictAction::Rename), "Keep both");
    EXPECT_EQ(lookup.label(OperationKind::CreateDirectory), "Create folder");
}
