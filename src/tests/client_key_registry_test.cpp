#include <gtest/gtest.h>
#include <fstream>
#include <set>
#include <thread>
#include "keys/client_key_registry.hpp"
#include "storage/storage_error.hpp"
#include "test_utils.hpp"

using namespace vault::keys;

class ClientKeyRegistryTest : public ::testing::Test {
protected:
  TempDir temp{"key_registry_test"};
  std::unique_ptr<ClientKeyRegistry> registry;

  void SetUp() override {
    init_test_logging();
    registry = std::make_unique<ClientKeyRegistry>(temp.path() / "config" / "client-keys.json");
  }
};

TEST_F(ClientKeyRegistryTest, CreateIssuesActiveHexKey) {
  auto record = registry->create("acme", std::string("first tenant"));

  EXPECT_EQ(record.id, 1);
  EXPECT_EQ(record.name, "acme");
  EXPECT_TRUE(record.is_active);
  EXPECT_EQ(record.key.size(), CLIENT_KEY_BYTES * 2);
  EXPECT_EQ(record.key.find_first_not_of("0123456789abcdef"), std::string::npos);
  EXPECT_EQ(record.note, std::optional<std::string>("first tenant"));
  EXPECT_FALSE(record.revoked_at.has_value());
  EXPECT_EQ(record.created_at, record.updated_at);
  EXPECT_TRUE(std::filesystem::exists(registry->store_file()));
}

TEST_F(ClientKeyRegistryTest, NewestRecordComesFirst) {
  registry->create("first");
  registry->create("second");

  auto all = registry->find_all();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].name, "second");
  EXPECT_EQ(all[0].id, 2);
  EXPECT_EQ(all[1].id, 1);
  EXPECT_NE(all[0].key, all[1].key);
}

TEST_F(ClientKeyRegistryTest, IdsKeepGrowingAfterRemoval) {
  registry->create("a");
  auto b = registry->create("b");
  ASSERT_TRUE(registry->remove(b.id));
  EXPECT_EQ(registry->create("c").id, 2);
  EXPECT_FALSE(registry->remove(99));
}

TEST_F(ClientKeyRegistryTest, ValidateKeyFollowsLifecycle) {
  auto record = registry->create("acme");
  EXPECT_TRUE(registry->validate_key(record.key));
  EXPECT_TRUE(registry->is_authorized(record.key));
  EXPECT_FALSE(registry->validate_key("unknown"));
  EXPECT_FALSE(registry->validate_key(""));

  auto revoked = registry->revoke(record.id);
  ASSERT_TRUE(revoked.has_value());
  EXPECT_FALSE(revoked->is_active);
  EXPECT_TRUE(revoked->revoked_at.has_value());
  EXPECT_FALSE(registry->validate_key(record.key));

  auto rotated = registry->rotate(record.id);
  ASSERT_TRUE(rotated.has_value());
  EXPECT_TRUE(rotated->is_active);
  EXPECT_FALSE(rotated->revoked_at.has_value());
  EXPECT_NE(rotated->key, record.key);
  EXPECT_FALSE(registry->validate_key(record.key));
  EXPECT_TRUE(registry->validate_key(rotated->key));
}

TEST_F(ClientKeyRegistryTest, UpdateAppliesOnlySetFields) {
  auto record = registry->create("acme", std::string("note"));

  ClientKeyPatch patch;
  patch.name = "acme-renamed";
  auto updated = registry->update(record.id, patch);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->name, "acme-renamed");
  EXPECT_EQ(updated->note, std::optional<std::string>("note"));
  EXPECT_EQ(updated->key, record.key);
  EXPECT_TRUE(updated->is_active);

  EXPECT_FALSE(registry->update(42, patch).has_value());
  EXPECT_FALSE(registry->revoke(42).has_value());
  EXPECT_FALSE(registry->rotate(42).has_value());
}

TEST_F(ClientKeyRegistryTest, RejectsEmptyName) {
  EXPECT_THROW(registry->create(""), vault::storage::InvalidArgumentError);
  ClientKeyPatch patch;
  patch.name = "";
  EXPECT_THROW(registry->update(1, patch), vault::storage::InvalidArgumentError);
}

TEST_F(ClientKeyRegistryTest, SurvivesReopening) {
  auto record = registry->create("acme");
  ClientKeyRegistry reopened(registry->store_file());
  auto found = reopened.find_one(record.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->key, record.key);
  EXPECT_TRUE(reopened.validate_key(record.key));
}

TEST_F(ClientKeyRegistryTest, MissingOrCorruptStoreReadsAsEmpty) {
  EXPECT_TRUE(registry->find_all().empty());

  write_file(registry->store_file(), "{ not json");
  EXPECT_TRUE(registry->find_all().empty());
  EXPECT_FALSE(registry->validate_key("anything"));

  write_file(registry->store_file(), "{\"id\": 1}");
  EXPECT_TRUE(registry->find_all().empty());
}

TEST_F(ClientKeyRegistryTest, ReadsRecordsWrittenByOtherTools) {
  write_file(registry->store_file(), R"([
    {"id": 7, "key": "abc", "name": "legacy", "isActive": true,
     "revokedAt": null, "createdAt": "2024-01-01T00:00:00.000Z", "updatedAt": "2024-01-01T00:00:00.000Z"}
  ])");

  auto found = registry->find_one(7);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->name, "legacy");
  EXPECT_FALSE(found->note.has_value());
  EXPECT_TRUE(registry->validate_key("abc"));
  EXPECT_EQ(registry->create("next").id, 8);
}

TEST_F(ClientKeyRegistryTest, ConcurrentCreatesGetDistinctIds) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([this, i]() {
      for (int j = 0; j < 5; ++j) {
        registry->create("tenant_" + std::to_string(i) + "_" + std::to_string(j));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto all = registry->find_all();
  ASSERT_EQ(all.size(), 20u);
  std::set<std::int64_t> ids;
  for (const auto& record : all) {
    ids.insert(record.id);
  }
  EXPECT_EQ(ids.size(), 20u);
}
