#include "stream/read_stream.h"
#include "stream_test_utils.hpp"

#include <vector>

using namespace appendfs;

class ReadStreamTest : public StreamTestBase {};

TEST_F(ReadStreamTest, ReadsCompletedContentAtOffset) {
  client_.putFile("/r", "hello world");
  auto stream = factory_->openForRead("/r");
  EXPECT_TRUE(stream->isReadOnly());

  std::vector<char> buf(5);
  EXPECT_EQ(stream->read(std::span<char>(buf), 5, 6), 5);
  EXPECT_EQ(std::string(buf.begin(), buf.end()), "world");
  // Past the end.
  EXPECT_EQ(stream->read(std::span<char>(buf), 5, 11), 0);
  EXPECT_EQ(stream->getStatus().getFileLength(), 11u);
  stream->close();
}

TEST_F(ReadStreamTest, HoldsReadLockUntilClose) {
  client_.putFile("/r", "abc");
  auto first = factory_->openForRead("/r");
  auto second = factory_->openForRead("/r");
  EXPECT_TRUE(locks_.isLocked("/r"));

  // Writers are shut out while anyone reads.
  EXPECT_EQ(errorCodeOf([&] { factory_->open("/r", O_WRONLY | O_TRUNC); }),
            StreamErrorCode::WriteConflict);

  first->close();
  EXPECT_TRUE(locks_.isLocked("/r"));
  second->close();
  EXPECT_FALSE(locks_.isLocked("/r"));
  auto writer = factory_->open("/r", O_WRONLY | O_TRUNC);
  writer->close();
}

TEST_F(ReadStreamTest, OpenForReadFailsWhileWriterHoldsPath) {
  auto writer = openNew("/w");
  EXPECT_EQ(errorCodeOf([&] { factory_->openForRead("/w"); }),
            StreamErrorCode::WriteConflict);
  writer->close();
}

TEST_F(ReadStreamTest, OpenForReadOfMissingPathReleasesLock) {
  EXPECT_EQ(errorCodeOf([&] { factory_->openForRead("/missing"); }),
            StreamErrorCode::NotFound);
  EXPECT_FALSE(locks_.isLocked("/missing"));
}

TEST_F(ReadStreamTest, IncompleteFileIsBusy) {
  client_.putFile("/partial", "abc", 0100644, false);
  auto stream = factory_->openForRead("/partial");
  std::vector<char> buf(3);
  EXPECT_EQ(errorCodeOf([&] { stream->read(std::span<char>(buf), 3, 0); }),
            StreamErrorCode::WriteConflict);
  client_.markComplete("/partial");
  EXPECT_EQ(stream->read(std::span<char>(buf), 3, 0), 3);
  stream->close();
}

TEST_F(ReadStreamTest, WriteAndTruncateAreRejected) {
  client_.putFile("/r", "abc");
  auto stream = factory_->openForRead("/r");
  EXPECT_EQ(errorCodeOf([&] { stream->write(bytesOf("x"), 1, 3); }),
            StreamErrorCode::UnsupportedOperation);
  EXPECT_EQ(errorCodeOf([&] { stream->truncate(0); }),
            StreamErrorCode::UnsupportedOperation);
  EXPECT_EQ(client_.contentOf("/r"), "abc");
  stream->close();
}

TEST_F(ReadStreamTest, CloseIsIdempotentAndDestructorReleases) {
  client_.putFile("/r", "abc");
  {
    auto stream = factory_->openForRead("/r");
    stream->close();
    stream->close();
    EXPECT_TRUE(stream->isClosed());
    std::vector<char> buf(1);
    EXPECT_EQ(errorCodeOf([&] { stream->read(std::span<char>(buf), 1, 0); }),
              StreamErrorCode::InvalidArgument);
  }
  {
    auto stream = factory_->openForRead("/r");
  }
  EXPECT_FALSE(locks_.isLocked("/r"));
}
