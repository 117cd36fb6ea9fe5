#include "taskwarden/storage/resource_repository.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskwarden;

class ResourceRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<DurableStore>(test::storage_config(db_.path()),
                                            clock_.fn());
    TaskRepository tasks(*store_);
    ASSERT_TRUE(tasks.migrate().has_value());
    repo_ = std::make_unique<ResourceRepository>(*store_, clock_.fn());
  }

  test::TempDb db_{"resources"};
  test::ManualClock clock_;
  std::unique_ptr<DurableStore> store_;
  std::unique_ptr<ResourceRepository> repo_;
};

TEST_F(ResourceRepositoryTest, CreateAndGet) {
  auto created = repo_->create(OwnerId{7}, "acme-main");
  ASSERT_TRUE(created.has_value());
  EXPECT_TRUE(created->id.valid());
  EXPECT_TRUE(created->active);

  auto loaded = repo_->get(OwnerId{7}, created->id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, "acme-main");
  EXPECT_EQ(loaded->owner_id, OwnerId{7});
  EXPECT_EQ(loaded->created_at, clock_.now());
}

TEST_F(ResourceRepositoryTest, Get_OtherOwnerIsNotFound) {
  auto created = repo_->create(OwnerId{7}, "acme-main");
  ASSERT_TRUE(created.has_value());

  auto r = repo_->get(OwnerId{8}, created->id);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(ResourceRepositoryTest, SetActive_AndListFilters) {
  auto a = repo_->create(OwnerId{7}, "a");
  auto b = repo_->create(OwnerId{7}, "b");
  ASSERT_TRUE(repo_->create(OwnerId{8}, "c").has_value());
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());

  ASSERT_TRUE(repo_->set_active(OwnerId{7}, a->id, false).has_value());

  auto all = repo_->list(OwnerId{7});
  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 2u);
  EXPECT_FALSE((*all)[0].active);

  auto active = repo_->list(OwnerId{7}, true);
  ASSERT_TRUE(active.has_value());
  ASSERT_EQ(active->size(), 1u);
  EXPECT_EQ((*active)[0].name, "b");
}

TEST_F(ResourceRepositoryTest, SetActive_OtherOwnerIsNotFound) {
  auto a = repo_->create(OwnerId{7}, "a");
  ASSERT_TRUE(a.has_value());

  auto r = repo_->set_active(OwnerId{8}, a->id, false);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
  auto still = repo_->get(OwnerId{7}, a->id);
  ASSERT_TRUE(still.has_value());
  EXPECT_TRUE(still->active);
}

TEST_F(ResourceRepositoryTest, Statistics) {
  auto a = repo_->create(OwnerId{7}, "a");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(repo_->create(OwnerId{7}, "b").has_value());
  ASSERT_TRUE(repo_->create(OwnerId{7}, "c").has_value());
  ASSERT_TRUE(repo_->set_active(OwnerId{7}, a->id, false).has_value());

  auto stats = repo_->statistics(OwnerId{7});
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total, 3);
  EXPECT_EQ(stats->active, 2);
  EXPECT_EQ(stats->inactive, 1);

  auto none = repo_->statistics(OwnerId{99});
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(none->total, 0);
}
