// Unit tests for canonurl/domain.hpp
// Tests: domain suffix matching, host cleanup, platform classification

#include <gtest/gtest.h>

#include <canonurl/domain.hpp>

#include <string>

namespace canonurl {
namespace {

// =============================================================================
// MatchesDomain Tests
// =============================================================================

class MatchesDomainTest : public ::testing::Test {};

TEST_F(MatchesDomainTest, ExactMatch) {
  EXPECT_TRUE(MatchesDomain("twitter.com", "twitter.com"));
  EXPECT_TRUE(MatchesDomain("x.com", "x.com"));
}

TEST_F(MatchesDomainTest, Subdomains) {
  EXPECT_TRUE(MatchesDomain("mobile.twitter.com", "twitter.com"));
  EXPECT_TRUE(MatchesDomain("a.b.c.twitter.com", "twitter.com"));
  EXPECT_TRUE(MatchesDomain("m.youtube.com", "youtube.com"));
}

TEST_F(MatchesDomainTest, RejectsSharedSuffixWithoutDot) {
  EXPECT_FALSE(MatchesDomain("nottwitter.com", "twitter.com"));
  EXPECT_FALSE(MatchesDomain("box.com", "x.com"));
}

TEST_F(MatchesDomainTest, RejectsDomainAsPrefix) {
  EXPECT_FALSE(MatchesDomain("twitter.com.attacker.net", "twitter.com"));
  EXPECT_FALSE(MatchesDomain("eviltwitter.com.attacker.net", "twitter.com"));
}

TEST_F(MatchesDomainTest, ShorterOrEmptyHost) {
  EXPECT_FALSE(MatchesDomain("", "twitter.com"));
  EXPECT_FALSE(MatchesDomain("com", "twitter.com"));
  EXPECT_FALSE(MatchesDomain(".twitter.com", "x.twitter.com"));
}

TEST_F(MatchesDomainTest, LeadingDotHost) {
  // "." + domain is itself a suffix match
  EXPECT_TRUE(MatchesDomain(".twitter.com", "twitter.com"));
}

// =============================================================================
// CleanHost Tests
// =============================================================================

TEST(CleanHostTest, Lowercases) {
  EXPECT_EQ(CleanHost("Example.COM"), "example.com");
}

TEST(CleanHostTest, StripsOneLeadingWww) {
  EXPECT_EQ(CleanHost("www.example.com"), "example.com");
  EXPECT_EQ(CleanHost("WWW.Example.com"), "example.com");
  EXPECT_EQ(CleanHost("www.www.example.com"), "www.example.com");
}

TEST(CleanHostTest, LeavesInnerWww) {
  EXPECT_EQ(CleanHost("shop.www.example.com"), "shop.www.example.com");
  EXPECT_EQ(CleanHost("wwwexample.com"), "wwwexample.com");
}

TEST(CleanHostTest, ShortInputs) {
  EXPECT_EQ(CleanHost(""), "");
  EXPECT_EQ(CleanHost("www"), "www");
  EXPECT_EQ(CleanHost("www."), "");
}

// =============================================================================
// ClassifyHost Tests
// =============================================================================

class ClassifyHostTest : public ::testing::Test {};

TEST_F(ClassifyHostTest, Twitter) {
  EXPECT_EQ(ClassifyHost("twitter.com"), Platform::kTwitter);
  EXPECT_EQ(ClassifyHost("mobile.twitter.com"), Platform::kTwitter);
  EXPECT_EQ(ClassifyHost("x.com"), Platform::kTwitter);
  EXPECT_EQ(ClassifyHost("api.x.com"), Platform::kTwitter);
}

TEST_F(ClassifyHostTest, YouTube) {
  EXPECT_EQ(ClassifyHost("youtube.com"), Platform::kYouTube);
  EXPECT_EQ(ClassifyHost("m.youtube.com"), Platform::kYouTube);
  EXPECT_EQ(ClassifyHost("music.youtube.com"), Platform::kYouTube);
  EXPECT_EQ(ClassifyHost("youtu.be"), Platform::kYouTube);
}

TEST_F(ClassifyHostTest, ShortLinkHostIsExactOnly) {
  EXPECT_EQ(ClassifyHost("sub.youtu.be"), Platform::kGeneric);
}

TEST_F(ClassifyHostTest, Generic) {
  EXPECT_EQ(ClassifyHost("example.com"), Platform::kGeneric);
  EXPECT_EQ(ClassifyHost("nottwitter.com"), Platform::kGeneric);
  EXPECT_EQ(ClassifyHost("box.com"), Platform::kGeneric);
  EXPECT_EQ(ClassifyHost("eviltwitter.com.attacker.net"), Platform::kGeneric);
  EXPECT_EQ(ClassifyHost(""), Platform::kGeneric);
}

TEST_F(ClassifyHostTest, SubstringMatchingIsLooser) {
  EXPECT_EQ(ClassifyHost("eviltwitter.com.attacker.net", HostMatching::kSubstring),
            Platform::kTwitter);
  EXPECT_EQ(ClassifyHost("box.com", HostMatching::kSubstring), Platform::kTwitter);
  EXPECT_EQ(ClassifyHost("notyoutube.community", HostMatching::kSubstring),
            Platform::kYouTube);
  EXPECT_EQ(ClassifyHost("sub.youtu.be", HostMatching::kSubstring), Platform::kYouTube);
  EXPECT_EQ(ClassifyHost("example.org", HostMatching::kSubstring), Platform::kGeneric);
}

TEST_F(ClassifyHostTest, PlatformNames) {
  EXPECT_EQ(PlatformName(Platform::kTwitter), "twitter");
  EXPECT_EQ(PlatformName(Platform::kYouTube), "youtube");
  EXPECT_EQ(PlatformName(Platform::kGeneric), "generic");
}

}  // namespace
}  // namespace canonurl
