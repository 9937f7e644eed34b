#include <gtest/gtest.h>

#include "cardlink/tags/content_tag_synchronizer.hpp"
#include "memory_store.hpp"
#include "test_helpers.hpp"

using namespace cardlink;
using namespace cardlink::tags;
using cardlink::test::MemoryStore;
using Op = MemoryStore::Operation;

class ContentTagSynchronizerTest : public ::testing::Test {
 protected:
  void SetUp() override { card_ = store_.addCard(kProject, "Card"); }

  std::vector<std::string> userTagNames() const {
    std::vector<std::string> result;
    for (const auto& tag : store_.tagsInNamespace(card_, core::kUserNamespace)) {
      result.push_back(tag.name);
    }
    return result;
  }

  static constexpr core::ProjectId kProject = 1;
  MemoryStore store_;
  core::CardId card_ = 0;
};

TEST_F(ContentTagSynchronizerTest, AttachesNewTags) {
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#alpha text #beta #alpha");

  EXPECT_EQ(report.added, (std::vector<std::string>{"alpha", "beta"}));
  EXPECT_TRUE(report.failed.empty());
  EXPECT_EQ(userTagNames(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(ContentTagSynchronizerTest, NoTagsNoCalls) {
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "# Heading only\nplain text");

  EXPECT_TRUE(report.added.empty());
  EXPECT_EQ(store_.callCount(Op::kListCardTags), 0u);
  EXPECT_EQ(store_.callCount(Op::kFindOrCreateTag), 0u);
}

TEST_F(ContentTagSynchronizerTest, SkipsAttachedTags) {
  store_.addTag(kProject, "alpha", std::string(core::kUserNamespace), {}, card_);
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#alpha #beta");

  EXPECT_EQ(report.added, std::vector<std::string>{"beta"});
  EXPECT_EQ(store_.callCount(Op::kFindOrCreateTag), 1u);
}

TEST_F(ContentTagSynchronizerTest, ReusesProjectTag) {
  auto existing = store_.addTag(kProject, "shared", std::string(core::kUserNamespace), {});
  ContentTagSynchronizer synchronizer(store_, store_);

  synchronizer.sync(card_, kProject, "#shared");

  auto tags = store_.tagsOf(card_);
  ASSERT_EQ(tags.size(), 1u);
  EXPECT_EQ(tags[0].id, existing);
  EXPECT_EQ(store_.tagCount(), 1u);
}

TEST_F(ContentTagSynchronizerTest, ReservedNamespaceNameDoesNotCount) {
  store_.addTag(kProject, "alpha", std::string(core::kReferenceNamespace), {}, card_);
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#alpha");

  EXPECT_EQ(report.added, std::vector<std::string>{"alpha"});
}

TEST_F(ContentTagSynchronizerTest, InvalidNamesAreIgnored) {
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#1 #3d #tag/ #a//b #ok");

  EXPECT_EQ(report.added, std::vector<std::string>{"ok"});
}

TEST_F(ContentTagSynchronizerTest, NeverRemovesTags) {
  ContentTagSynchronizer synchronizer(store_, store_);
  synchronizer.sync(card_, kProject, "#alpha");

  auto report = synchronizer.sync(card_, kProject, "#beta only now");

  EXPECT_EQ(report.added, std::vector<std::string>{"beta"});
  EXPECT_EQ(userTagNames(), (std::vector<std::string>{"alpha", "beta"}));
  EXPECT_EQ(store_.callCount(Op::kDeleteTag), 0u);
}

TEST_F(ContentTagSynchronizerTest, ListingFailureStillAttaches) {
  store_.failOn(Op::kListCardTags);
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#alpha");

  EXPECT_EQ(report.added, std::vector<std::string>{"alpha"});
}

TEST_F(ContentTagSynchronizerTest, FailuresAreReportedPerName) {
  store_.failOnce(Op::kFindOrCreateTag);
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#first #second");

  EXPECT_EQ(report.failed, std::vector<std::string>{"first"});
  EXPECT_EQ(report.added, std::vector<std::string>{"second"});
}

TEST_F(ContentTagSynchronizerTest, AssociationFailureIsReported) {
  store_.failOn(Op::kAssociateTag);
  ContentTagSynchronizer synchronizer(store_, store_);

  auto report = synchronizer.sync(card_, kProject, "#alpha");

  EXPECT_TRUE(report.added.empty());
  EXPECT_EQ(report.failed, std::vector<std::string>{"alpha"});
}
