#include "client/in_memory_file_client.h"
#include "utilities/errors.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace appendfs;

TEST(InMemoryFileClient, CreateWriteCloseCompletesFile) {
  InMemoryFileClient client;
  CreateOptions opts;
  opts.mode = 0100600;
  opts.uid = 5;
  opts.gid = 6;
  opts.writeOptions.storageTier = "HDD";

  auto out = client.createFile("/f", opts);
  auto info = client.getStatus("/f");
  ASSERT_TRUE(info.has_value());
  EXPECT_FALSE(info->completed);
  EXPECT_EQ(info->length, 0u);

  out->write("abc", 3);
  EXPECT_EQ(out->bytesWritten(), 3u);
  EXPECT_EQ(client.getStatus("/f")->length, 0u);
  out->close();

  info = client.getStatus("/f");
  EXPECT_TRUE(info->completed);
  EXPECT_EQ(info->length, 3u);
  EXPECT_EQ(info->mode, 0100600u);
  EXPECT_EQ(info->uid, 5u);
  EXPECT_EQ(info->gid, 6u);
  EXPECT_EQ(info->contentDigest,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(client.writeOptionsOf("/f")->storageTier, "HDD");
  EXPECT_NO_THROW(out->close());
}

TEST(InMemoryFileClient, PutFileDigestMatchesWrittenDigest) {
  InMemoryFileClient client;
  client.putFile("/p", "abc");
  EXPECT_EQ(client.getStatus("/p")->contentDigest,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_FALSE(client.writeOptionsOf("/p").has_value());
}

TEST(InMemoryFileClient, FlushPublishesWithoutCompleting) {
  InMemoryFileClient client;
  auto out = client.createFile("/flush", CreateOptions{});
  out->write("12", 2);
  out->flush();
  EXPECT_EQ(client.contentOf("/flush"), "12");
  EXPECT_FALSE(client.getStatus("/flush")->completed);
  out->write("34", 2);
  out->close();
  EXPECT_EQ(client.contentOf("/flush"), "1234");
}

TEST(InMemoryFileClient, CreateExistingFails) {
  InMemoryFileClient client;
  client.putFile("/dup", "x");
  try {
    client.createFile("/dup", CreateOptions{});
    FAIL() << "expected AlreadyExists";
  } catch (const StreamException &e) {
    EXPECT_EQ(e.code(), StreamErrorCode::AlreadyExists);
  }
}

TEST(InMemoryFileClient, DeleteAndReadMissingFileReportNotFound) {
  InMemoryFileClient client;
  try {
    client.deleteFile("/missing");
    FAIL() << "expected NotFound";
  } catch (const StreamException &e) {
    EXPECT_EQ(e.code(), StreamErrorCode::NotFound);
  }
  EXPECT_THROW(client.readFile("/missing", 0, 1), StreamException);
}

TEST(InMemoryFileClient, HandleOfDeletedFileFails) {
  InMemoryFileClient client;
  auto out = client.createFile("/gone", CreateOptions{});
  out->write("x", 1);
  client.deleteFile("/gone");
  client.createFile("/gone", CreateOptions{});
  EXPECT_THROW(out->flush(), StreamException);
  EXPECT_EQ(client.contentOf("/gone"), "");
}

TEST(InMemoryFileClient, ReadFileHonorsOffsetAndSize) {
  InMemoryFileClient client;
  client.putFile("/r", "0123456789");
  auto part = client.readFile("/r", 3, 4);
  EXPECT_EQ(std::string(part.begin(), part.end()), "3456");
  EXPECT_EQ(client.readFile("/r", 8, 100).size(), 2u);
  EXPECT_TRUE(client.readFile("/r", 10, 5).empty());
}

TEST(InMemoryFileClient, ListFilesIsSortedByPath) {
  InMemoryFileClient client;
  client.putFile("/b", "");
  client.putFile("/a", "");
  client.putFile("/c", "");
  auto files = client.listFiles();
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].path, "/a");
  EXPECT_EQ(files[2].path, "/c");
}

TEST(InMemoryFileClient, WaitForCompletionWakesOnClose) {
  InMemoryFileClient client;
  auto out = client.createFile("/w", CreateOptions{});
  std::thread writer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    out->write("done", 4);
    out->close();
  });
  auto info = client.waitForCompletion("/w", std::chrono::milliseconds(5000),
                                       std::chrono::milliseconds(10), nullptr);
  writer.join();
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->completed);
  EXPECT_EQ(info->length, 4u);
}

TEST(InMemoryFileClient, WaitForCompletionTimesOutOrCancels) {
  InMemoryFileClient client;
  client.putFile("/stuck", "x", 0100644, false);
  EXPECT_FALSE(client
                   .waitForCompletion("/stuck", std::chrono::milliseconds(20),
                                      std::chrono::milliseconds(5), nullptr)
                   .has_value());

  std::atomic<bool> cancel{true};
  EXPECT_FALSE(client
                   .waitForCompletion("/stuck", std::chrono::milliseconds(5000),
                                      std::chrono::milliseconds(5), &cancel)
                   .has_value());
  EXPECT_FALSE(client
                   .waitForCompletion("/absent", std::chrono::milliseconds(20),
                                      std::chrono::milliseconds(5), nullptr)
                   .has_value());
}

TEST(InMemoryFileClient, InjectedFailuresRaiseRuntimeIO) {
  InMemoryFileClient client;
  client.setFailure(InMemoryFileClient::FailurePoint::Create, true);
  EXPECT_THROW(client.createFile("/f", CreateOptions{}), StreamException);
  client.setFailure(InMemoryFileClient::FailurePoint::Create, false);

  auto out = client.createFile("/f", CreateOptions{});
  client.setFailure(InMemoryFileClient::FailurePoint::Write, true);
  EXPECT_THROW(out->write("x", 1), StreamException);
  EXPECT_EQ(out->bytesWritten(), 0u);
  client.setFailure(InMemoryFileClient::FailurePoint::Write, false);

  client.setFailure(InMemoryFileClient::FailurePoint::Delete, true);
  EXPECT_THROW(client.deleteFile("/f"), StreamException);
  client.setFailure(InMemoryFileClient::FailurePoint::Delete, false);
  EXPECT_NO_THROW(client.deleteFile("/f"));
}
