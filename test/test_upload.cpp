#include "exception.hpp"
#include "fake_transport.hpp"
#include "repository.hpp"
#include "transfer_client.hpp"
#include "upload.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

class recording_observer : public iarepo::progress_observer {
 public:
  std::string name;
  uint64_t started_total = 0;
  std::vector<std::pair<uint64_t, uint64_t>> reports;

  void on_start(const std::string& n, uint64_t total) override {
    name = n;
    started_total = total;
  }

  void on_progress(uint64_t bytes_so_far, uint64_t total_bytes) override {
    reports.emplace_back(bytes_so_far, total_bytes);
  }
};

class UploadTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir = fs::temp_directory_path() / ("iarepo_test_upload_" + name);
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override { fs::remove_all(test_dir); }

  fs::path CreateFile(const std::string& name, size_t size) {
    fs::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    for (size_t i = 0; i < size; i++) file.put(static_cast<char>('a' + i % 26));
    return path;
  }

  fs::path test_dir;
};

TEST_F(UploadTest, ChunkCount) {
  const uint64_t mib = 1024 * 1024;
  const std::vector<uint64_t> sizes = {1, 10, 2 * mib - 1, 2 * mib, 2 * mib + 1, 5 * mib};

  for (uint64_t size : sizes) {
    fs::path path = CreateFile("f.bin", size);
    recording_observer observer;
    iarepo::chunked_file_body body(path, &observer);

    std::vector<char> buffer(iarepo::chunk_size);
    uint64_t total = 0;
    size_t reads = 0;
    size_t n;
    while ((n = body.read(buffer.data(), buffer.size())) > 0) {
      total += n;
      reads++;
    }

    size_t expected = (size + iarepo::chunk_size - 1) / iarepo::chunk_size;
    EXPECT_EQ(total, size);
    EXPECT_EQ(body.chunks(), expected) << "size " << size;
    EXPECT_EQ(reads, expected) << "size " << size;
    EXPECT_EQ(observer.reports.size(), expected) << "size " << size;
  }
}

TEST_F(UploadTest, SmallReadsDoNotChangeChunking) {
  fs::path path = CreateFile("f.bin", 3 * 1024 * 1024);
  recording_observer observer;
  iarepo::chunked_file_body body(path, &observer);

  // curl asks for much less than a chunk at a time
  char buffer[16 * 1024];
  std::string data;
  size_t n;
  while ((n = body.read(buffer, sizeof(buffer))) > 0) data.append(buffer, n);

  EXPECT_EQ(data.size(), 3u * 1024 * 1024);
  EXPECT_EQ(body.chunks(), 2u);
  ASSERT_EQ(observer.reports.size(), 2u);
  EXPECT_EQ(observer.reports[0].first, iarepo::chunk_size);
  EXPECT_EQ(observer.reports[1].first, 3u * 1024 * 1024);
}

TEST_F(UploadTest, ProgressIsMonotonicAcrossRewind) {
  const uint64_t size = 5 * 1024 * 1024;
  fs::path path = CreateFile("f.bin", size);
  recording_observer observer;
  iarepo::chunked_file_body body(path, &observer);

  std::vector<char> buffer(iarepo::chunk_size);
  body.read(buffer.data(), buffer.size());
  body.read(buffer.data(), buffer.size());
  body.rewind();
  while (body.read(buffer.data(), buffer.size()) > 0) {
  }

  uint64_t last = 0;
  size_t completions = 0;
  for (const auto& report : observer.reports) {
    EXPECT_GE(report.first, last);
    EXPECT_EQ(report.second, size);
    last = report.first;
    if (report.first == size) completions++;
  }
  EXPECT_EQ(last, size);
  EXPECT_EQ(completions, 1u);
}

TEST_F(UploadTest, UploadSendsOneStreamedPut) {
  fs::path path = CreateFile("b.txt", 3 * 1024 * 1024);
  fake_transport transport;
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  recording_observer observer;
  repo.upload(path, "sub", &observer);

  ASSERT_EQ(transport.calls.size(), 1u);
  EXPECT_EQ(transport.calls[0].method, iarepo::http_method::put);
  EXPECT_EQ(transport.calls[0].url, "https://s3.example.org/mybook123/sub/b.txt");
  EXPECT_EQ(transport.calls[0].chunks, 2u);
  EXPECT_EQ(transport.calls[0].body.size(), 3u * 1024 * 1024);
  EXPECT_EQ(observer.name, "sub/b.txt");
  EXPECT_EQ(observer.started_total, 3u * 1024 * 1024);
  EXPECT_EQ(observer.reports.back().first, 3u * 1024 * 1024);
}

TEST_F(UploadTest, UploadToRoot) {
  fs::path path = CreateFile("a.txt", 10);
  fake_transport transport;
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  repo.upload(path, "");
  ASSERT_EQ(transport.calls.size(), 1u);
  EXPECT_EQ(transport.calls[0].url, "https://s3.example.org/mybook123/a.txt");
  EXPECT_EQ(transport.calls[0].chunks, 1u);
}

TEST_F(UploadTest, EmptyFileReportsCompletionOnce) {
  fs::path path = CreateFile("empty.txt", 0);
  fake_transport transport;
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  recording_observer observer;
  repo.upload(path, "dir", &observer);
  EXPECT_EQ(transport.calls[0].chunks, 0u);
  ASSERT_EQ(observer.reports.size(), 1u);
  EXPECT_EQ(observer.reports[0], std::make_pair(uint64_t(0), uint64_t(0)));
}

TEST_F(UploadTest, UploadRetriesWholeStream) {
  fs::path path = CreateFile("b.txt", 3 * 1024 * 1024);
  fake_transport transport;
  transport.respond(503);
  transport.respond(200);
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  recording_observer observer;
  repo.upload(path, "sub", &observer);

  ASSERT_EQ(transport.calls.size(), 2u);
  EXPECT_EQ(transport.calls[1].chunks, 2u);
  EXPECT_EQ(transport.calls[1].body.size(), 3u * 1024 * 1024);
  EXPECT_EQ(observer.reports.size(), 2u);
}

TEST_F(UploadTest, UploadFailed) {
  fs::path path = CreateFile("a.txt", 10);
  fake_transport transport;
  transport.respond(400, "bad request");
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  try {
    repo.upload(path, "dir");
    FAIL() << "expected upload_failed";
  }
  catch (const iarepo::upload_failed& e) {
    EXPECT_EQ(e.status(), 400);
    EXPECT_EQ(e.body(), "bad request");
  }
}

TEST_F(UploadTest, UploadForbidden) {
  fs::path path = CreateFile("a.txt", 10);
  fake_transport transport;
  transport.respond(403, "forbidden");
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  try {
    repo.upload(path, "dir");
    FAIL() << "expected upload_failed";
  }
  catch (const iarepo::upload_failed& e) {
    EXPECT_EQ(e.status(), 403);
  }
  EXPECT_EQ(transport.calls.size(), 1u);
}

TEST_F(UploadTest, MissingFile) {
  fake_transport transport;
  iarepo::transfer_client client(transport, test_config(), no_sleep);
  iarepo::repository repo(client, "mybook123");

  EXPECT_THROW(repo.upload(test_dir / "missing.txt", "dir"), iarepo::upload_failed);
  EXPECT_TRUE(transport.calls.empty());
}

TEST_F(UploadTest, MissingCredentials) {
  fs::path path = CreateFile("a.txt", 10);
  fake_transport transport;
  iarepo::config cfg = test_config();
  cfg.auth = iarepo::credentials();
  iarepo::transfer_client client(transport, cfg, no_sleep);
  iarepo::repository repo(client, "mybook123");

  EXPECT_THROW(repo.upload(path, "dir"), iarepo::auth_config_error);
  EXPECT_TRUE(transport.calls.empty());
}
