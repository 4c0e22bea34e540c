#include <gtest/gtest.h>
#include "core/checkpoint_store.h"
#include "core/errors.h"
#include <climits>
#include <fstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace nanoflow::core;
namespace fs = std::filesystem;

class CheckpointStoreTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("nanoflow_checkpoint_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    RunState sample_state(const std::string& run_id = "run-1") {
        auto state = RunState::fresh(run_id, {"convert-format", "basecall"});
        StageResult r;
        r.stage = "convert-format";
        r.exit_code = 0;
        state.append(r);
        state.resume_point = "basecall";
        return state;
    }

    void write_lock(const std::string& run_id, const std::string& content) {
        fs::create_directories(dir_);
        std::ofstream(CheckpointStore(dir_).lock_path(run_id)) << content;
    }
};

TEST_F(CheckpointStoreTest, LoadMissingReturnsNullopt) {
    CheckpointStore store(dir_);
    EXPECT_FALSE(store.load("run-1").has_value());
    EXPECT_FALSE(store.exists("run-1"));
}

TEST_F(CheckpointStoreTest, SaveAndLoad) {
    CheckpointStore store(dir_);
    store.save(sample_state());

    EXPECT_TRUE(store.exists("run-1"));
    EXPECT_FALSE(fs::exists(store.state_path("run-1").string() + ".tmp"));

    auto loaded = store.load("run-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->resume_point, "basecall");
    ASSERT_EQ(loaded->results.size(), 1u);
    EXPECT_TRUE(loaded->stage_succeeded("convert-format"));
}

TEST_F(CheckpointStoreTest, SaveReplacesPreviousState) {
    CheckpointStore store(dir_);
    auto state = sample_state();
    store.save(state);

    state.status = RunStatus::Succeeded;
    state.resume_point.reset();
    store.save(state);

    auto loaded = store.load("run-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, RunStatus::Succeeded);
    EXPECT_FALSE(loaded->resume_point.has_value());
}

TEST_F(CheckpointStoreTest, CorruptCheckpointThrows) {
    fs::create_directories(dir_);
    CheckpointStore store(dir_);
    std::ofstream(store.state_path("run-1")) << "{\"run_id\": \"run-1\", \"stat";
    EXPECT_THROW(store.load("run-1"), PersistenceError);
}

TEST_F(CheckpointStoreTest, MismatchedRunIdThrows) {
    CheckpointStore store(dir_);
    store.save(sample_state("run-1"));
    fs::copy_file(store.state_path("run-1"), store.state_path("run-2"));
    EXPECT_THROW(store.load("run-2"), PersistenceError);
}

TEST_F(CheckpointStoreTest, InvalidRunId) {
    EXPECT_TRUE(CheckpointStore::is_valid_run_id("sample_01.rep-2"));
    EXPECT_FALSE(CheckpointStore::is_valid_run_id(""));
    EXPECT_FALSE(CheckpointStore::is_valid_run_id(".."));
    EXPECT_FALSE(CheckpointStore::is_valid_run_id("a/b"));
    EXPECT_FALSE(CheckpointStore::is_valid_run_id("with space"));

    CheckpointStore store(dir_);
    EXPECT_THROW(store.load("../escape"), ConfigurationError);
}

TEST_F(CheckpointStoreTest, AcquireAndRelease) {
    CheckpointStore store(dir_);
    {
        auto lock = store.acquire("run-1");
        EXPECT_TRUE(lock.held());
        EXPECT_TRUE(fs::exists(store.lock_path("run-1")));
        EXPECT_EQ(store.lock_owner("run-1"), ::getpid());

        // Same process may still write
        EXPECT_NO_THROW(store.save(sample_state()));
    }
    EXPECT_FALSE(fs::exists(store.lock_path("run-1")));
    EXPECT_FALSE(store.lock_owner("run-1").has_value());
}

TEST_F(CheckpointStoreTest, SecondAcquireInSameProcessFails) {
    CheckpointStore store(dir_);
    auto lock = store.acquire("run-1");
    EXPECT_THROW(store.acquire("run-1"), ConcurrentWriterError);
}

TEST_F(CheckpointStoreTest, LiveForeignLockRejectsWriters) {
    // pid 1 always exists
    write_lock("run-1", "1\n");
    CheckpointStore store(dir_);

    EXPECT_THROW(store.acquire("run-1"), ConcurrentWriterError);
    EXPECT_THROW(store.save(sample_state()), ConcurrentWriterError);
    EXPECT_FALSE(store.exists("run-1"));
}

TEST_F(CheckpointStoreTest, StaleLockIsTakenOver) {
    write_lock("run-1", std::to_string(INT_MAX) + "\n");
    CheckpointStore store(dir_);

    auto lock = store.acquire("run-1");
    EXPECT_TRUE(lock.held());
    EXPECT_EQ(store.lock_owner("run-1"), ::getpid());
}

TEST_F(CheckpointStoreTest, HeldLockWinsOverDeadPidInFile) {
    // Another writer holds the lock but its file still shows the dead previous owner
    write_lock("run-1", std::to_string(INT_MAX) + "\n");
    CheckpointStore store(dir_);
    int holder = ::open(store.lock_path("run-1").c_str(), O_RDWR | O_CLOEXEC);
    ASSERT_GE(holder, 0);
    ASSERT_EQ(::flock(holder, LOCK_EX | LOCK_NB), 0);

    EXPECT_THROW(store.acquire("run-1"), ConcurrentWriterError);
    EXPECT_TRUE(fs::exists(store.lock_path("run-1")));

    ::close(holder);
    auto lock = store.acquire("run-1");
    EXPECT_TRUE(lock.held());
    EXPECT_EQ(store.lock_owner("run-1"), ::getpid());
}

TEST_F(CheckpointStoreTest, ReleaseKeepsLockFileOfNewWriter) {
    CheckpointStore store(dir_);
    auto lock = store.acquire("run-1");

    // The lock file was replaced behind this writer's back
    fs::remove(store.lock_path("run-1"));
    write_lock("run-1", "1\n");

    lock.release();
    EXPECT_FALSE(lock.held());
    ASSERT_TRUE(fs::exists(store.lock_path("run-1")));
    EXPECT_EQ(store.lock_owner("run-1"), 1);
}

TEST_F(CheckpointStoreTest, LockMoveTransfersOwnership) {
    CheckpointStore store(dir_);
    auto first = store.acquire("run-1");
    WriterLock second = std::move(first);

    EXPECT_FALSE(first.held());
    EXPECT_TRUE(second.held());

    second.release();
    EXPECT_FALSE(second.held());
    EXPECT_FALSE(fs::exists(store.lock_path("run-1")));
}

TEST_F(CheckpointStoreTest, InterruptedSaveLeavesPreviousState) {
    CheckpointStore store(dir_);
    store.save(sample_state());

    // A writer died after writing part of the replacement
    auto tmp = store.state_path("run-1");
    tmp += ".tmp";
    std::ofstream(tmp) << "{\"run_id\": \"run-1\", \"status\": \"runn";

    auto loaded = store.load("run-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->resume_point, "basecall");

    // The next save replaces the leftover
    auto state = sample_state();
    state.status = RunStatus::Succeeded;
    store.save(state);
    EXPECT_EQ(store.load("run-1")->status, RunStatus::Succeeded);
    EXPECT_FALSE(fs::exists(tmp));
}
