#include "planner.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using ::testing::Test;

class PlannerTest : public Test {
protected:
  TempDb tmp;
  Store store{tmp.path};
  Planner planner{store};
};

TEST_F(PlannerTest, EverythingIsNewOnAnEmptyStore) {
  auto out = planner.needs_indexing({ "c", "a", "b" }, "es");
  EXPECT_EQ(out, (std::vector<std::string>{ "c", "a", "b" }));
  EXPECT_TRUE(planner.needs_indexing({}, "es").empty());
}

TEST_F(PlannerTest, ExcludesVideosAlreadyAttemptedInTheLanguage) {
  store.set_language_availability("v1", "es", true);
  EXPECT_EQ(planner.needs_indexing({ "v1", "v2" }, "es"), (std::vector<std::string>{ "v2" }));
  // another language is still open
  EXPECT_EQ(planner.needs_indexing({ "v1", "v2" }, "en"),
            (std::vector<std::string>{ "v1", "v2" }));
}

TEST_F(PlannerTest, NegativeRowsExcludeInEveryLanguage) {
  store.set_language_availability("v1", "es", false);
  EXPECT_EQ(planner.needs_indexing({ "v1", "v2" }, "es"), (std::vector<std::string>{ "v2" }));
  EXPECT_EQ(planner.needs_indexing({ "v1", "v2" }, "en"), (std::vector<std::string>{ "v2" }));
}

TEST_F(PlannerTest, CollapsesDuplicatesKeepingFirstPosition) {
  auto out = planner.needs_indexing({ "b", "a", "b", "c", "a" }, "es");
  EXPECT_EQ(out, (std::vector<std::string>{ "b", "a", "c" }));
}

TEST_F(PlannerTest, HandlesLargeCandidateLists) {
  std::vector<std::string> ids;
  for (int i = 0; i < 1000; ++i) ids.push_back("vid" + std::to_string(i));
  for (int i = 0; i < 1000; i += 2) store.set_language_availability(ids[i], "es", true);
  auto out = planner.needs_indexing(ids, "es");
  ASSERT_EQ(out.size(), 500u);
  EXPECT_EQ(out.front(), "vid1");
  EXPECT_EQ(out.back(), "vid999");
}

TEST_F(PlannerTest, IdsNeedNoEscaping) {
  auto out = planner.needs_indexing({ "it's", "quo\"te", "back\\slash" }, "es");
  EXPECT_EQ(out.size(), 3u);
  EXPECT_EQ(out[1], "quo\"te");
}
