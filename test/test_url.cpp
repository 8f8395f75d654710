#include "url.hpp"

#include <gtest/gtest.h>

TEST(Url, Parse) {
  iarepo::url url("http://www.example.com:8080/path/to/file.html");
  EXPECT_EQ(url.scheme(), "http");
  EXPECT_EQ(url.host(), "www.example.com:8080");
  EXPECT_EQ(url.path(), "/path/to/file.html");
}

TEST(Url, Parse_NoPath) {
  iarepo::url url("https://s3.us.archive.org");
  EXPECT_EQ(url.scheme(), "https");
  EXPECT_EQ(url.host(), "s3.us.archive.org");
  EXPECT_EQ(url.path(), "/");
}

TEST(Url, Parse_NoScheme) {
  iarepo::url url("archive.org/details/x");
  EXPECT_EQ(url.scheme(), "");
  EXPECT_EQ(url.host(), "archive.org");
  EXPECT_EQ(url.path(), "/details/x");
}

TEST(Url, TrailingSlashDropped) {
  iarepo::url url("https://archive.org/");
  EXPECT_EQ(url.string(), "https://archive.org");
}

TEST(Url, Join) {
  iarepo::url base("https://s3.us.archive.org");
  EXPECT_EQ((base / "mybook" / "sub/b.txt").string(), "https://s3.us.archive.org/mybook/sub/b.txt");
  EXPECT_EQ((base / "mybook" / "" / "a.txt").string(), "https://s3.us.archive.org/mybook/a.txt");
  EXPECT_EQ((base / "/mybook/" / "/a.txt").string(), "https://s3.us.archive.org/mybook/a.txt");
}

TEST(Url, EscapePath) {
  EXPECT_EQ(iarepo::escape_path("sub dir/a+b.txt"), "sub%20dir/a%2Bb.txt");
  EXPECT_EQ(iarepo::escape_path("plain/file-1_2.~x"), "plain/file-1_2.~x");
}
