#include "exception.hpp"
#include "identifier.hpp"

#include <gtest/gtest.h>

TEST(Identifier, DetailsUrl) {
  EXPECT_EQ(iarepo::resolve_identifier("https://archive.org/details/mybook123"), "mybook123");
  EXPECT_EQ(iarepo::resolve_identifier("https://archive.org/details/mybook123/"), "mybook123");
  EXPECT_EQ(iarepo::resolve_identifier("https://archive.org/details/mybook123/page/n5"), "mybook123");
  EXPECT_EQ(iarepo::resolve_identifier("http://archive.org/details/my-book_1.0?tab=about"), "my-book_1.0");
  EXPECT_EQ(iarepo::resolve_identifier("archive.org/details/abc#top"), "abc");
}

TEST(Identifier, DetailsUrlOnOtherHost) {
  EXPECT_EQ(iarepo::resolve_identifier("https://mirror.example.org/details/item42"), "item42");
}

TEST(Identifier, BareIdentifier) {
  EXPECT_EQ(iarepo::resolve_identifier("mybook123"), "mybook123");
  EXPECT_EQ(iarepo::resolve_identifier("my.book-1_2"), "my.book-1_2");
}

TEST(Identifier, StripsQuotesAndWhitespace) {
  EXPECT_EQ(iarepo::resolve_identifier("  \"https://archive.org/details/mybook123\"\n"), "mybook123");
  EXPECT_EQ(iarepo::resolve_identifier("'mybook123'"), "mybook123");
}

TEST(Identifier, Invalid) {
  EXPECT_THROW(iarepo::resolve_identifier(""), iarepo::invalid_reference);
  EXPECT_THROW(iarepo::resolve_identifier("   "), iarepo::invalid_reference);
  EXPECT_THROW(iarepo::resolve_identifier("not an identifier"), iarepo::invalid_reference);
  EXPECT_THROW(iarepo::resolve_identifier("https://archive.org/search?query=x"), iarepo::invalid_reference);
  EXPECT_THROW(iarepo::resolve_identifier("https://archive.org/details/"), iarepo::invalid_reference);
  EXPECT_THROW(iarepo::resolve_identifier("-leading-dash"), iarepo::invalid_reference);
}

TEST(Identifier, IsValid) {
  EXPECT_TRUE(iarepo::is_valid_identifier("a"));
  EXPECT_TRUE(iarepo::is_valid_identifier("mybook123"));
  EXPECT_FALSE(iarepo::is_valid_identifier(""));
  EXPECT_FALSE(iarepo::is_valid_identifier("a/b"));
  EXPECT_FALSE(iarepo::is_valid_identifier(".hidden"));
}
