#include <gtest/gtest.h>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/key/engine_keys.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>
#include <crowdfund/testing/common.hpp>

#include <string>

namespace {

using encoder_t = crowdfund::schema::encoding::encoder<
    crowdfund::schema::encoding::scale_encoder_tag>;
using storage_t =
    crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>;

class rocksdb_storage_test : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = crowdfund::testing::make_db_path("crowdfund_storage");
    storage_ = crowdfund::storage::make_storage<
        crowdfund::storage::rocksdb_storage_tag>(path_);
  }

  void TearDown() override {
    storage_.database.reset();
    crowdfund::testing::remove_path(path_);
  }

  std::string path_;
  storage_t storage_;
  encoder_t encoder_;
};

}  // namespace

TEST_F(rocksdb_storage_test, missing_key_reads_as_nullopt) {
  auto key = crowdfund::schema::key::make_account_key(
      crowdfund::testing::make_hash(1));
  EXPECT_FALSE((storage_.get<encoder_t, crowdfund::schema::account_t>(
                    encoder_, key))
                   .has_value());
  EXPECT_FALSE(storage_.load_committed_state().has_value());
}

TEST_F(rocksdb_storage_test, committed_value_decodes_through_encoder) {
  auto key = crowdfund::schema::key::make_nonce_key(
      crowdfund::testing::make_pubkey(2));
  storage_.commit({{key, encoder_.encode(uint64_t{17})}},
                  crowdfund::storage::committed_state{.height = 1});
  auto value = storage_.get<encoder_t, uint64_t>(encoder_, key);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 17u);
}

TEST_F(rocksdb_storage_test, commit_writes_entries_and_checkpoint_together) {
  auto first = crowdfund::schema::key::make_account_key(
      crowdfund::testing::make_hash(3));
  auto second = crowdfund::schema::key::make_account_key(
      crowdfund::testing::make_hash(4));
  storage_.commit({{first, crowdfund::schema::bytes_t{1}},
                   {second, crowdfund::schema::bytes_t{2}}},
                  crowdfund::storage::committed_state{
                      .height = 5,
                      .state_root = crowdfund::testing::make_hash(6)});

  auto committed = storage_.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 5);
  EXPECT_EQ(committed->state_root, crowdfund::testing::make_hash(6));
  auto first_value = storage_.get_raw(first);
  auto second_value = storage_.get_raw(second);
  ASSERT_TRUE(first_value.has_value());
  ASSERT_TRUE(second_value.has_value());
  EXPECT_EQ(*first_value, crowdfund::schema::bytes_t{1});
  EXPECT_EQ(*second_value, crowdfund::schema::bytes_t{2});
}

TEST_F(rocksdb_storage_test, committed_state_survives_reopen) {
  auto key = crowdfund::schema::key::make_account_key(
      crowdfund::testing::make_hash(9));
  storage_.commit({{key, crowdfund::schema::bytes_t{7}}},
                  crowdfund::storage::committed_state{
                      .height = 3,
                      .state_root = crowdfund::testing::make_hash(8)});
  storage_.database.reset();

  storage_ = crowdfund::storage::make_storage<
      crowdfund::storage::rocksdb_storage_tag>(path_);
  auto committed = storage_.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 3);
  EXPECT_EQ(committed->state_root, crowdfund::testing::make_hash(8));
  auto value = storage_.get_raw(key);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, crowdfund::schema::bytes_t{7});
}
