#include "linexform/core/errors.hpp"
#include "linexform/text_file_transformer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>

namespace linexform {

using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(bool, is_regular_file, (const std::filesystem::path& path), (override));
    MOCK_METHOD(bool, is_readable, (const std::filesystem::path& path), (override));
    MOCK_METHOD(bool, is_directory, (const std::filesystem::path& path), (override));
    MOCK_METHOD(std::unique_ptr<std::istream>, open_read, (const std::filesystem::path& path),
                (override));
    MOCK_METHOD(std::unique_ptr<std::ostream>, open_write, (const std::filesystem::path& path),
                (override));
};

class TransformerPreconditionsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_fs_ = std::make_shared<NiceMock<MockFileSystem>>();
        transformer_ = std::make_unique<TextFileTransformer>(
            [](const std::string& line) { return line; }, mock_fs_);
    }

    auto expect_no_streams_opened() -> void
    {
        EXPECT_CALL(*mock_fs_, open_read(_)).Times(0);
        EXPECT_CALL(*mock_fs_, open_write(_)).Times(0);
    }

    auto precondition_message() -> std::string
    {
        try {
            transformer_->transform(source_, destination_);
        } catch (const PreconditionError& e) {
            return e.what();
        }
        return "";
    }

    std::shared_ptr<NiceMock<MockFileSystem>> mock_fs_;
    std::unique_ptr<TextFileTransformer> transformer_;
    const std::filesystem::path source_ = "/data/source.txt";
    const std::filesystem::path destination_ = "/data/destination.txt";
};

TEST_F(TransformerPreconditionsTest, ChecksRunInOrderBeforeOpening)
{
    {
        InSequence sequence;
        EXPECT_CALL(*mock_fs_, is_regular_file(source_)).WillOnce(Return(true));
        EXPECT_CALL(*mock_fs_, is_readable(source_)).WillOnce(Return(true));
        EXPECT_CALL(*mock_fs_, is_directory(destination_)).WillOnce(Return(false));
        EXPECT_CALL(*mock_fs_, open_read(source_))
            .WillOnce([](const std::filesystem::path&) -> std::unique_ptr<std::istream> {
                return std::make_unique<std::istringstream>("a\nb\n");
            });
        EXPECT_CALL(*mock_fs_, open_write(destination_))
            .WillOnce([](const std::filesystem::path&) -> std::unique_ptr<std::ostream> {
                return std::make_unique<std::ostringstream>();
            });
    }

    EXPECT_NO_THROW(transformer_->transform(source_, destination_));
}

TEST_F(TransformerPreconditionsTest, NotRegularFileStopsAtFirstCheck)
{
    EXPECT_CALL(*mock_fs_, is_regular_file(source_)).WillOnce(Return(false));
    EXPECT_CALL(*mock_fs_, is_readable(_)).Times(0);
    EXPECT_CALL(*mock_fs_, is_directory(_)).Times(0);
    expect_no_streams_opened();

    EXPECT_EQ(precondition_message(), "Source must be regular file.");
}

TEST_F(TransformerPreconditionsTest, UnreadableIsCheckedIndependently)
{
    EXPECT_CALL(*mock_fs_, is_regular_file(source_)).WillOnce(Return(true));
    EXPECT_CALL(*mock_fs_, is_readable(source_)).WillOnce(Return(false));
    EXPECT_CALL(*mock_fs_, is_directory(_)).Times(0);
    expect_no_streams_opened();

    EXPECT_EQ(precondition_message(), "Source must be readable file.");
}

TEST_F(TransformerPreconditionsTest, DirectoryDestinationIsRejected)
{
    EXPECT_CALL(*mock_fs_, is_regular_file(source_)).WillOnce(Return(true));
    EXPECT_CALL(*mock_fs_, is_readable(source_)).WillOnce(Return(true));
    EXPECT_CALL(*mock_fs_, is_directory(destination_)).WillOnce(Return(true));
    expect_no_streams_opened();

    EXPECT_EQ(precondition_message(), "Destination cannot be directory.");
}

TEST_F(TransformerPreconditionsTest, OpenFailurePropagatesIoError)
{
    EXPECT_CALL(*mock_fs_, is_regular_file(source_)).WillOnce(Return(true));
    EXPECT_CALL(*mock_fs_, is_readable(source_)).WillOnce(Return(true));
    EXPECT_CALL(*mock_fs_, is_directory(destination_)).WillOnce(Return(false));
    EXPECT_CALL(*mock_fs_, open_read(source_))
        .WillOnce([](const std::filesystem::path& path) -> std::unique_ptr<std::istream> {
            throw IoError("Cannot open file for reading", path);
        });
    EXPECT_CALL(*mock_fs_, open_write(_)).Times(0);

    EXPECT_THROW(transformer_->transform(source_, destination_), IoError);
}

TEST_F(TransformerPreconditionsTest, ReadFailureIsIoError)
{
    ON_CALL(*mock_fs_, is_regular_file(_)).WillByDefault(Return(true));
    ON_CALL(*mock_fs_, is_readable(_)).WillByDefault(Return(true));
    ON_CALL(*mock_fs_, is_directory(_)).WillByDefault(Return(false));
    EXPECT_CALL(*mock_fs_, open_read(source_))
        .WillOnce([](const std::filesystem::path&) -> std::unique_ptr<std::istream> {
            auto input = std::make_unique<std::istringstream>("");
            input->setstate(std::ios::badbit);
            return input;
        });
    EXPECT_CALL(*mock_fs_, open_write(destination_))
        .WillOnce([](const std::filesystem::path&) -> std::unique_ptr<std::ostream> {
            return std::make_unique<std::ostringstream>();
        });

    try {
        transformer_->transform(source_, destination_);
        FAIL() << "Expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.path(), source_);
    }
}

} // namespace linexform
