#include "taskwarden/app/application.hpp"
#include "taskwarden/scheduler/scheduler.hpp"
#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/storage/resource_repository.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include <filesystem>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskwarden;
using namespace std::chrono_literals;

class ApplicationTest : public ::testing::Test {
protected:
  auto make_config() -> SystemConfig {
    SystemConfig config;
    config.storage = test::storage_config(db_.path());
    config.scheduler.poll_interval = 10ms;
    config.scheduler.loader_interval = 1s;
    config.scheduler.shutdown_timeout = 5s;
    config.tenant_logs.directory = (dir_.path() / "users").string();
    return config;
  }

  static auto wait_for_status(Application& app, const Task& task,
                              TaskStatus status) -> bool {
    return test::wait_until([&] {
      auto loaded = app.tasks().get(task.owner_id, task.id);
      return loaded && loaded->status == status;
    });
  }

  test::TempDb db_{"app"};
  test::TempDir dir_;
};

TEST_F(ApplicationTest, RecoverBeforeInit_Fails) {
  Application app(make_config());

  auto r = app.recover();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_FALSE(app.start().has_value());
}

TEST_F(ApplicationTest, Init_RejectsUnknownExecutorBinding) {
  auto config = make_config();
  config.executors["warmup"] = "selenium";
  Application app(std::move(config));

  auto r = app.init();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ExecutorNotFound));
}

TEST_F(ApplicationTest, EndToEnd_RunsTaskAndWritesTenantLog) {
  Application app(make_config());
  ASSERT_TRUE(app.init().has_value());

  auto resource = app.resources().create(OwnerId{7}, "acme-main");
  ASSERT_TRUE(resource.has_value());
  auto task = app.tasks().create(
      NewTask{.owner_id = OwnerId{7}, .resource_id = resource->id});
  ASSERT_TRUE(task.has_value());

  auto recovered = app.recover();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(recovered->tasks_requeued, 1u);

  ASSERT_TRUE(app.start().has_value());
  EXPECT_TRUE(app.is_running());
  ASSERT_TRUE(wait_for_status(app, *task, TaskStatus::Completed));
  app.stop();
  EXPECT_FALSE(app.is_running());

  auto log_path = dir_.path() / "users" / "7" / "logs" / "user.log";
  ASSERT_TRUE(std::filesystem::exists(log_path));
  EXPECT_GT(std::filesystem::file_size(log_path), 0u);
}

TEST_F(ApplicationTest, Restart_RecoversTasksLeftRunning) {
  Task task;
  {
    Application first(make_config());
    ASSERT_TRUE(first.init().has_value());
    auto created = first.tasks().create(
        NewTask{.owner_id = OwnerId{3}, .resource_id = ResourceId{30}});
    ASSERT_TRUE(created.has_value());
    task = *created;
    // Simulates a crash mid-session.
    ASSERT_TRUE(first.tasks().mark_running(OwnerId{3}, task.id).has_value());
  }

  Application second(make_config());
  ASSERT_TRUE(second.init().has_value());
  auto recovered = second.recover();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(recovered->tasks_reopened, 1u);
  EXPECT_EQ(recovered->tasks_requeued, 1u);

  ASSERT_TRUE(second.start().has_value());
  EXPECT_TRUE(wait_for_status(second, task, TaskStatus::Completed));
  second.stop();
}

TEST_F(ApplicationTest, Loader_PicksUpTasksCreatedWhileRunning) {
  Application app(make_config());
  ASSERT_TRUE(app.init().has_value());
  ASSERT_TRUE(app.start().has_value());

  auto task = app.tasks().create(
      NewTask{.owner_id = OwnerId{5}, .resource_id = ResourceId{50}});
  ASSERT_TRUE(task.has_value());

  EXPECT_TRUE(wait_for_status(app, *task, TaskStatus::Completed));
  EXPECT_EQ(app.store().primary_address(), db_.path());
  app.stop();
}
