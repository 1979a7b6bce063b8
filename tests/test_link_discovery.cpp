/**
 * @file test_link_discovery.cpp
 * @brief Tests for anchor extraction and URL helpers
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mediagrab/LinkDiscovery.hpp"

using namespace mediagrab;

namespace {

const char* kPage = "http://example.com/music/index.html";

}  // namespace

// =============================================================================
// EXTENSIONS
// =============================================================================

TEST(LinkDiscovery, MediaUrlMatchesKnownExtensions) {
    EXPECT_TRUE(isMediaUrl("http://h/a.mp3"));
    EXPECT_TRUE(isMediaUrl("http://h/a.FLAC"));
    EXPECT_TRUE(isMediaUrl("http://h/a.m4a"));
    EXPECT_TRUE(isMediaUrl("http://h/a.oggdownload"));
    EXPECT_FALSE(isMediaUrl("http://h/a.mp4"));
    EXPECT_FALSE(isMediaUrl("http://h/index.html"));
}

TEST(LinkDiscovery, FixDownloadSuffix) {
    EXPECT_EQ(fixDownloadSuffix("song.mp3download"), "song.mp3");
    EXPECT_EQ(fixDownloadSuffix("Song.MP3download"), "Song.mp3");
    EXPECT_EQ(fixDownloadSuffix("song.mp3"), "song.mp3");
}

// =============================================================================
// EXTRACTION
// =============================================================================

TEST(LinkDiscovery, ExtractsMediaAnchorsInDocumentOrder) {
    const std::string html =
        "<html><body>"
        "<a href=\"one.mp3\">First Song</a>"
        "<a href='/other/page.html'>Not audio</a>"
        "<A HREF=two.wav>Second</A>"
        "<a class=\"x\" href=\"http://cdn.example.com/three.flac\"><b>Third</b> Take</a>"
        "</body></html>";
    const auto links = extractMediaLinks(html, kPage);
    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0].sourceUrl, "http://example.com/music/one.mp3");
    EXPECT_EQ(links[0].name, "First Song");
    EXPECT_EQ(links[1].sourceUrl, "http://example.com/music/two.wav");
    EXPECT_EQ(links[1].name, "Second");
    EXPECT_EQ(links[2].sourceUrl, "http://cdn.example.com/three.flac");
    EXPECT_EQ(links[2].name, "ThirdTake");
}

TEST(LinkDiscovery, FallsBackToPathSegment) {
    const auto links = extractMediaLinks("<a href=\"/files/My%20Track.ogg\"></a>", kPage);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].sourceUrl, "http://example.com/files/My%20Track.ogg");
    EXPECT_EQ(links[0].name, "My Track.ogg");
}

TEST(LinkDiscovery, DecodesEntitiesAndEscapesInText) {
    const auto links = extractMediaLinks(
        "<a href=\"a.mp3?x=1&amp;y=2\">Rock &amp; Roll%21</a>", "http://h/dir/");
    ASSERT_EQ(links.size(), 0u); // query string hides the extension

    const auto plain = extractMediaLinks("<a href=\"a.mp3\">Rock &amp; Roll%21</a>", "http://h/dir/");
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].name, "Rock & Roll!");
}

TEST(LinkDiscovery, DownloadSuffixNameIsFixed) {
    const auto links = extractMediaLinks("<a href=\"get/live.mp3download\">live.mp3download</a>", kPage);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].name, "live.mp3");
}

TEST(LinkDiscovery, IgnoresOtherTagsAndMissingHref) {
    const std::string html =
        "<abbr href=\"x.mp3\">no</abbr>"
        "<area href=\"y.mp3\">"
        "<a name=\"top\">anchor</a>"
        "<a title=\"a > b\" href=\"z.mp3\">quoted gt</a>";
    const auto links = extractMediaLinks(html, kPage);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].sourceUrl, "http://example.com/music/z.mp3");
    EXPECT_EQ(links[0].name, "quoted gt");
}

TEST(LinkDiscovery, KeepsDuplicates) {
    const auto links = extractMediaLinks("<a href=\"a.mp3\">A</a><a href=\"a.mp3\">A again</a>", kPage);
    EXPECT_EQ(links.size(), 2u);
}

// =============================================================================
// URL HELPERS
// =============================================================================

TEST(LinkDiscovery, ResolveUrlReferenceForms) {
    const std::string base = "http://a/b/c/d;p?q";
    EXPECT_EQ(resolveUrl(base, "g"), "http://a/b/c/g");
    EXPECT_EQ(resolveUrl(base, "./g"), "http://a/b/c/g");
    EXPECT_EQ(resolveUrl(base, "g/"), "http://a/b/c/g/");
    EXPECT_EQ(resolveUrl(base, "/g"), "http://a/g");
    EXPECT_EQ(resolveUrl(base, "?y"), "http://a/b/c/d;p?y");
    EXPECT_EQ(resolveUrl(base, "../g"), "http://a/b/g");
    EXPECT_EQ(resolveUrl(base, "../../g"), "http://a/g");
    EXPECT_EQ(resolveUrl(base, "https://other/x.mp3"), "https://other/x.mp3");
}

TEST(LinkDiscovery, ResolveUrlWithoutUsableBase) {
    EXPECT_EQ(resolveUrl("not a page", "track.mp3"), "");
    EXPECT_EQ(resolveUrl("not a page", "http://h/track.mp3"), "http://h/track.mp3");
}

TEST(LinkDiscovery, UnresolvableHrefIsSkipped) {
    const std::string html =
        R"(<a href="a.mp3">A</a><a href="http://h/b.mp3">B</a>)";
    const auto links = extractMediaLinks(html, "no base here");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].sourceUrl, "http://h/b.mp3");
}

TEST(LinkDiscovery, PercentDecode) {
    EXPECT_EQ(percentDecode("a%20b"), "a b");
    EXPECT_EQ(percentDecode("a+b"), "a+b");
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz"), "%zz");
}

TEST(LinkDiscovery, NormalizeUrl) {
    EXPECT_EQ(normalizeUrl("  HTTP://Example.COM/Path/A.mp3#frag "), "http://example.com/Path/A.mp3");
    EXPECT_EQ(normalizeUrl("http://User@HOST/x"), "http://User@host/x");
    EXPECT_EQ(normalizeUrl("http://h/a.mp3"), normalizeUrl("http://H/a.mp3#t=10"));
}
