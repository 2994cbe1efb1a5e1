#include "search.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace {

class SearchTest : public ::testing::Test {
protected:
  TempDb tmp;
  Store store{tmp.path};

  void add(const std::string& id, const std::string& uploader, const std::string& lang,
           const std::vector<Segment>& segs, const std::string& url = "") {
    store.write_captions(channel(uploader), video(id, uploader, url), lang, segs);
  }
};

} // namespace

TEST_F(SearchTest, OrdersByVideoThenStart) {
  add("b", "@x", "es", { segment(50, 52, "hola amigos") });
  add("a", "@x", "es", { segment(10, 12, "hola otra vez"), segment(5, 7, "hola") ,
                         segment(20, 22, "adios") });
  auto rows = search_all(store, SearchQuery{ "hola", "", "" });
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].video_id, "a");
  EXPECT_EQ(rows[0].start_seconds, 5);
  EXPECT_EQ(rows[1].video_id, "a");
  EXPECT_EQ(rows[1].start_seconds, 10);
  EXPECT_EQ(rows[2].video_id, "b");
  EXPECT_EQ(rows[2].start_seconds, 50);
}

TEST_F(SearchTest, RowCarriesJoinedMetadataAndPaddedLink) {
  add("v", "@x", "es", { segment(100, 110, "la frase buscada") }, "https://x/v");
  auto rows = search_all(store, SearchQuery{ "frase", "", "" });
  ASSERT_EQ(rows.size(), 1u);
  const ResultRow& r = rows[0];
  EXPECT_EQ(r.link, "https://x/v&start=96&end=112");
  EXPECT_EQ(r.uploader_id, "@x");
  EXPECT_EQ(r.channel_name, "Channel @x");
  EXPECT_EQ(r.video_title, "Title v");
  EXPECT_EQ(r.upload_date, "2023-04-05");
  EXPECT_EQ(r.start_seconds, 100);
  EXPECT_EQ(r.end_seconds, 110);
  EXPECT_EQ(r.start_time, "00:00:100.000");
  EXPECT_EQ(r.lang, "es");
  EXPECT_EQ(r.text, "la frase buscada");
  EXPECT_GT(r.subtitle_id, 0);
}

TEST_F(SearchTest, FiltersByUploaderAndLanguage) {
  add("v1", "@x", "es", { segment(1, 2, "gato") });
  add("v1", "@x", "en", { segment(1, 2, "gato cat") });
  add("v2", "@y", "es", { segment(3, 4, "gato") });

  EXPECT_EQ(search_all(store, SearchQuery{ "gato", "", "" }).size(), 3u);
  EXPECT_EQ(search_all(store, SearchQuery{ "gato", "@x", "" }).size(), 2u);
  EXPECT_EQ(search_all(store, SearchQuery{ "gato", "", "es" }).size(), 2u);

  auto rows = search_all(store, SearchQuery{ "gato", "@y", "es" });
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].video_id, "v2");
  EXPECT_TRUE(search_all(store, SearchQuery{ "gato", "@y", "en" }).empty());
}

TEST_F(SearchTest, PhraseQueriesMatchWholePhrase) {
  add("v1", "@x", "es", { segment(1, 2, "buenos dias"), segment(3, 4, "dias buenos") });
  auto rows = search_all(store, SearchQuery{ "\"buenos dias\"", "", "" });
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].start_seconds, 1);
}

TEST_F(SearchTest, NoMatchesIsAnEmptyCursor) {
  auto cursor = search(store, SearchQuery{ "nada", "", "" });
  ResultRow r;
  EXPECT_FALSE(cursor.next(r));
  EXPECT_FALSE(cursor.next(r));
}

TEST_F(SearchTest, CursorIsRestartedBySearchingAgain) {
  add("v1", "@x", "es", { segment(1, 2, "uno"), segment(3, 4, "uno mas") });
  auto first = search(store, SearchQuery{ "uno", "", "" });
  ResultRow r;
  ASSERT_TRUE(first.next(r));
  ASSERT_TRUE(first.next(r));
  EXPECT_FALSE(first.next(r));

  auto again = search(store, SearchQuery{ "uno", "", "" });
  ASSERT_TRUE(again.next(r));
  EXPECT_EQ(r.start_seconds, 1);
}

TEST_F(SearchTest, ReindexedTextIsSearchableAndOldTextIsNot) {
  add("v1", "@x", "es", { segment(1, 2, "viejo") });
  add("v1", "@x", "es", { segment(1, 2, "nuevo") });
  EXPECT_TRUE(search_all(store, SearchQuery{ "viejo", "", "" }).empty());
  EXPECT_EQ(search_all(store, SearchQuery{ "nuevo", "", "" }).size(), 1u);
}

TEST_F(SearchTest, RemovedChannelsDisappearFromResults) {
  add("v1", "@x", "es", { segment(1, 2, "perro") });
  add("v2", "@y", "es", { segment(1, 2, "perro") });
  store.delete_channel("@x");
  auto rows = search_all(store, SearchQuery{ "perro", "", "" });
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].video_id, "v2");
}

TEST_F(SearchTest, InvalidMatchExpressionRaises) {
  add("v1", "@x", "es", { segment(1, 2, "texto") });
  EXPECT_THROW(search_all(store, SearchQuery{ "\"unbalanced", "", "" }), StoreError);
}
