#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

#include "QueueStore.h"

class JsonStore : public ::testing::Test {
protected:
  std::string dir;

  void SetUp() override {
    char tmpl[] = "/tmp/rqserv_store_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir = tmpl;
  }
  void TearDown() override {
    std::string cmd = "rm -rf '" + dir + "'";
    EXPECT_EQ(std::system(cmd.c_str()), 0);
  }
};

TEST_F(JsonStore, MissingSessionIsEmpty) {
  JsonQueueStore store(dir);
  std::vector<std::string> texts = {"stale"};
  EXPECT_EQ(store.load("nobody", texts), RQ_OK);
  EXPECT_TRUE(texts.empty());
}

TEST_F(JsonStore, SaveThenLoad) {
  std::vector<std::string> saved = {
    "robot say_text {hello \"there\"}", "robot battery"
  };
  {
    JsonQueueStore store(dir);
    ASSERT_EQ(store.save("alice", saved), RQ_OK);
  }

  // a fresh store over the same directory sees the queue
  JsonQueueStore store(dir);
  std::vector<std::string> loaded;
  ASSERT_EQ(store.load("alice", loaded), RQ_OK);
  EXPECT_EQ(loaded, saved);
  EXPECT_NE(access((dir + "/alice.json").c_str(), F_OK), -1);
  EXPECT_EQ(access((dir + "/alice.json.tmp").c_str(), F_OK), -1);
}

TEST_F(JsonStore, InvalidTextLeavesSavedQueueAlone) {
  JsonQueueStore store(dir);
  ASSERT_EQ(store.save("erin", {"robot battery"}), RQ_OK);

  EXPECT_EQ(store.save("erin", {"robot status", "robot say_text \xff"}),
	    RQ_ERROR);

  std::vector<std::string> texts;
  ASSERT_EQ(store.load("erin", texts), RQ_OK);
  EXPECT_EQ(texts, std::vector<std::string>{"robot battery"});
}

TEST_F(JsonStore, RemoveForgetsQueue) {
  JsonQueueStore store(dir);
  ASSERT_EQ(store.save("bob", {"a"}), RQ_OK);
  EXPECT_EQ(store.remove("bob"), RQ_OK);
  EXPECT_EQ(store.remove("bob"), RQ_OK);

  std::vector<std::string> texts;
  EXPECT_EQ(store.load("bob", texts), RQ_OK);
  EXPECT_TRUE(texts.empty());
}

TEST_F(JsonStore, CorruptFileIsAnError) {
  {
    std::ofstream out(dir + "/carol.json");
    out << "{\"commands\": [";
  }
  JsonQueueStore store(dir);
  std::vector<std::string> texts;
  EXPECT_EQ(store.load("carol", texts), RQ_ERROR);
  EXPECT_TRUE(texts.empty());
}

TEST_F(JsonStore, CreatesDirectory) {
  std::string sub = dir + "/queues";
  JsonQueueStore store(sub);
  EXPECT_EQ(store.save("dee", {"robot battery"}), RQ_OK);
  EXPECT_NE(access((sub + "/dee.json").c_str(), F_OK), -1);
}

TEST(JsonQueueStore, SessionIds) {
  EXPECT_TRUE(JsonQueueStore::valid_session_id("alice"));
  EXPECT_TRUE(JsonQueueStore::valid_session_id("user-42_a.b"));

  EXPECT_FALSE(JsonQueueStore::valid_session_id(""));
  EXPECT_FALSE(JsonQueueStore::valid_session_id("../etc/passwd"));
  EXPECT_FALSE(JsonQueueStore::valid_session_id(".hidden"));
  EXPECT_FALSE(JsonQueueStore::valid_session_id("a b"));
  EXPECT_FALSE(JsonQueueStore::valid_session_id(std::string(129, 'x')));
}

TEST(JsonQueueStore, InvalidSessionIsRefused) {
  JsonQueueStore store(::testing::TempDir());
  std::vector<std::string> texts;
  EXPECT_EQ(store.save("../escape", {"a"}), RQ_ERROR);
  EXPECT_EQ(store.load("../escape", texts), RQ_ERROR);
  EXPECT_EQ(store.remove("../escape"), RQ_ERROR);
}

TEST(MemoryQueueStore, KeepsQueuesPerSession) {
  MemoryQueueStore store;
  std::vector<std::string> texts;

  EXPECT_EQ(store.load("alice", texts), RQ_OK);
  EXPECT_TRUE(texts.empty());

  store.save("alice", {"a", "b"});
  store.save("bob", {"c"});
  store.load("alice", texts);
  EXPECT_EQ(texts, (std::vector<std::string>{"a", "b"}));

  store.remove("alice");
  store.load("alice", texts);
  EXPECT_TRUE(texts.empty());
  store.load("bob", texts);
  EXPECT_EQ(texts.size(), 1u);
}
