#include <gtest/gtest.h>
#include <bunkget/downloader/page_extractor.hpp>

#include <string>

using namespace bunkget::downloader;

namespace {

const char* kAlbumPage = R"HTML(<!DOCTYPE html>
<html>
<head>
  <title>Album</title>
  <script>var html = '<a class="after:absolute after:z-10 after:inset-0" href="/f/fake">';</script>
</head>
<body>
  <div class="text-subs font-semibold flex text-base sm:text-lg">
    <h1 class="truncate">Summer &amp; Sea <span>2024</span></h1>
  </div>
  <!-- <a class="after:absolute after:z-10 after:inset-0" href="/f/commented"></a> -->
  <div class="grid">
    <div class="theItem"><a class="after:absolute after:z-10 after:inset-0 block" href="/f/one"></a></div>
    <div class="theItem"><a href="/f/plain-link"></a></div>
    <div class="theItem"><a class='after:inset-0 after:absolute after:z-10' href='/v/two'></a></div>
    <div class="theItem"><a class="after:absolute after:z-10 after:inset-0" href="https://elsewhere.example/f/abs"></a></div>
    <div class="theItem"><a class="after:absolute after:z-10 after:inset-0" href="/f/three?x=1&amp;y=2"></a></div>
  </div>
</body>
</html>)HTML";

const char* kItemPage = R"HTML(<html><body>
  <h1 class="text-lg">Site header</h1>
  <h1 class="text-subs font-semibold text-base sm:text-lg truncate extra">
     My&nbsp;Video &#8211; part&#x20;1.mp4
  </h1>
  <script>const slug = "abcDEF12";</script>
</body></html>)HTML";

const char* kStatusPage = R"HTML(<html><body>
<div class="list">
  <div class="flex items-center gap-4 py-4 border-b border-soft last:border-b-0">
    <div><p class="name">Kebab</p><p>ignored</p></div>
    <span class="badge">Operational</span>
  </div>
  <div class="flex items-center gap-4 py-4 border-b border-soft last:border-b-0">
    <p>Burger</p>
    <span>  Non-operational </span>
  </div>
  <div class="flex items-center gap-4 py-4 border-b border-soft last:border-b-0">
    <span>Operational</span>
  </div>
</div>
</body></html>)HTML";

} // namespace

TEST(PageExtractorTest, ItemLinksInDocumentOrderWithMarkerClass) {
    auto extractor = makeHtmlPageExtractor();
    auto links = extractor->itemLinks(kAlbumPage);
    ASSERT_EQ(links.size(), 4u);
    EXPECT_EQ(links[0], "/f/one");
    EXPECT_EQ(links[1], "/v/two");
    EXPECT_EQ(links[2], "https://elsewhere.example/f/abs");
    EXPECT_EQ(links[3], "/f/three?x=1&y=2");
}

TEST(PageExtractorTest, NoMatchingAnchorsGivesEmptyList) {
    auto extractor = makeHtmlPageExtractor();
    EXPECT_TRUE(extractor->itemLinks("<html><body><a href='/f/x'>x</a></body></html>").empty());
    EXPECT_TRUE(extractor->itemLinks("").empty());
    EXPECT_TRUE(extractor->itemLinks("<a class=").empty());
}

TEST(PageExtractorTest, AlbumNameFromHeaderDiv) {
    auto extractor = makeHtmlPageExtractor();
    EXPECT_EQ(extractor->albumName(kAlbumPage).value_or(""), "Summer & Sea 2024");
    EXPECT_FALSE(extractor->albumName(kItemPage).has_value());
}

TEST(PageExtractorTest, DisplayedFilenameDecodesEntitiesAndWhitespace) {
    auto extractor = makeHtmlPageExtractor();
    auto name = extractor->displayedFilename(kItemPage);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "My Video \xE2\x80\x93 part 1.mp4");
    EXPECT_FALSE(extractor->displayedFilename(kAlbumPage).has_value());
}

TEST(PageExtractorTest, IdentifierPrefersUrlSlugThenPage) {
    auto extractor = makeHtmlPageExtractor();
    EXPECT_EQ(extractor->identifier("https://bunkr.cr/f/urlSlug", kItemPage), "urlSlug");
    EXPECT_EQ(extractor->identifier("https://bunkr.cr/f/not%20a%20slug", kItemPage), "abcDEF12");
}

TEST(PageExtractorTest, StatusRowsNameAndState) {
    auto extractor = makeHtmlPageExtractor();
    auto rows = extractor->statusRows(kStatusPage);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, "Kebab");
    EXPECT_EQ(rows[0].second, "Operational");
    EXPECT_EQ(rows[1].first, "Burger");
    EXPECT_EQ(rows[1].second, "Non-operational");
}

TEST(PageExtractorTest, CustomMarkers) {
    PageMarkers markers;
    markers.itemLinkClass = "item";
    auto extractor = makeHtmlPageExtractor(markers);
    auto links = extractor->itemLinks(R"(<a class="item big" href="/f/a"></a><a class="big" href="/f/b"></a>)");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0], "/f/a");
}

TEST(HtmlTextTest, DecodeEntities) {
    EXPECT_EQ(html::decodeEntities("a &amp; b &lt;c&gt; &quot;d&quot;"), "a & b <c> \"d\"");
    EXPECT_EQ(html::decodeEntities("&#233;&#xE9;"), "\xC3\xA9\xC3\xA9");
    EXPECT_EQ(html::decodeEntities("&unknown; & &#;"), "&unknown; & &#;");
}

TEST(HtmlTextTest, TextContentStripsTagsAndCollapsesSpace) {
    EXPECT_EQ(html::textContent("  <b>Hello</b>\n\t <i>world</i>  "), "Hello world");
    EXPECT_EQ(html::textContent(""), "");
}
