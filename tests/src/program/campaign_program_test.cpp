#include <gtest/gtest.h>
#include <crowdfund/address/derive.hpp>
#include <crowdfund/program/campaign_program.hpp>
#include <crowdfund/schema/layout/campaign.hpp>
#include <crowdfund/testing/common.hpp>

#include <functional>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace {

using crowdfund::schema::program_error_code;
using crowdfund::schema::transaction_error_code;

constexpr auto kReserve = crowdfund::schema::lamports_t{5'456'640};
constexpr auto kCreatorFunds = crowdfund::schema::lamports_t{10'000'000'000};
constexpr auto kDonorFunds = crowdfund::schema::lamports_t{5'000'000'000};

struct outcome final {
  std::optional<crowdfund::runtime::error> error;
  std::vector<std::string> logs;
};

// Runs each instruction against a fresh overlay of `committed_` and merges its
// writes back only on success, the way the engine does.
class campaign_program_test : public ::testing::Test {
 protected:
  void SetUp() override {
    committed_[creator_] = crowdfund::schema::account_t{.lamports = kCreatorFunds};
    committed_[donor_] = crowdfund::schema::account_t{.lamports = kDonorFunds};
  }

  outcome run(const std::function<std::optional<crowdfund::runtime::error>(
                  crowdfund::runtime::invocation_context&)>& instruction) {
    auto store = crowdfund::runtime::account_store{
        crowdfund::schema::rent_t{},
        [this](const crowdfund::schema::address_t& address)
            -> std::optional<crowdfund::schema::account_t> {
          auto it = committed_.find(address);
          if (it == std::end(committed_)) {
            return std::nullopt;
          }
          return it->second;
        }};
    auto context = crowdfund::runtime::invocation_context{store};
    auto error = instruction(context);
    if (!error) {
      for (const auto& [address, account] : store.changes()) {
        committed_[address] = account;
      }
    }
    return outcome{.error = std::move(error), .logs = std::move(context.logs)};
  }

  outcome create(const crowdfund::schema::pubkey_t& requester,
                 std::string name,
                 std::string description) {
    auto instruction = crowdfund::schema::create_campaign_t{};
    instruction.campaign = crowdfund::address::campaign_address(requester);
    instruction.name = std::move(name);
    instruction.description = std::move(description);
    return run([&](auto& context) {
      return crowdfund::program::create(context, requester, instruction);
    });
  }

  outcome donate(const crowdfund::schema::pubkey_t& donor,
                 const crowdfund::schema::lamports_t amount) {
    auto instruction =
        crowdfund::schema::donate_t{.campaign = campaign_, .amount = amount};
    return run([&](auto& context) {
      return crowdfund::program::donate(context, donor, instruction);
    });
  }

  outcome withdraw(const crowdfund::schema::pubkey_t& requester,
                   const crowdfund::schema::lamports_t amount) {
    auto instruction =
        crowdfund::schema::withdraw_t{.campaign = campaign_, .amount = amount};
    return run([&](auto& context) {
      return crowdfund::program::withdraw(context, requester, instruction);
    });
  }

  crowdfund::schema::campaign_t record() {
    const auto& data = committed_.at(campaign_).data;
    auto value = crowdfund::schema::layout::read(
        crowdfund::schema::bytes_view_t{data.data(), data.size()});
    EXPECT_TRUE(value.has_value());
    return value.value_or(crowdfund::schema::campaign_t{});
  }

  crowdfund::schema::lamports_t balance(const crowdfund::schema::address_t& address) {
    auto it = committed_.find(address);
    return it == std::end(committed_) ? 0 : it->second.lamports;
  }

  crowdfund::schema::pubkey_t creator_{crowdfund::testing::make_pubkey(1)};
  crowdfund::schema::pubkey_t donor_{crowdfund::testing::make_pubkey(2)};
  crowdfund::schema::address_t campaign_{
      crowdfund::address::campaign_address(creator_)};
  std::map<crowdfund::schema::address_t, crowdfund::schema::account_t>
      committed_;
};

void expect_runtime_error(const outcome& result, const transaction_error_code code) {
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, static_cast<uint32_t>(code));
  EXPECT_EQ(result.error->codespace, "crowdfund.runtime");
}

void expect_program_error(const outcome& result, const program_error_code code) {
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, static_cast<uint32_t>(code));
  EXPECT_EQ(result.error->codespace, "crowdfund.program");
  EXPECT_EQ(result.error->message, crowdfund::schema::message(code));
}

}  // namespace

TEST_F(campaign_program_test, build_a_well_scenario) {
  auto created = create(creator_, "Build a well", "Clean water");
  ASSERT_FALSE(created.error.has_value());
  ASSERT_EQ(created.logs.size(), 1u);
  EXPECT_EQ(created.logs[0], "Campaign created successfully");

  auto donated = donate(donor_, 1'000'000);
  ASSERT_FALSE(donated.error.has_value());
  EXPECT_EQ(donated.logs, std::vector<std::string>{"Donation successful"});
  EXPECT_EQ(record().amount_donated, 1'000'000u);
  EXPECT_EQ(balance(campaign_), kReserve + 1'000'000);

  auto admin_before = balance(creator_);
  auto withdrawn = withdraw(creator_, 900'000);
  ASSERT_FALSE(withdrawn.error.has_value());
  EXPECT_EQ(withdrawn.logs, std::vector<std::string>{"Withdrawal successful"});
  EXPECT_EQ(balance(creator_), admin_before + 900'000);
  EXPECT_EQ(balance(campaign_), kReserve + 100'000);
  EXPECT_EQ(record().amount_donated, 1'000'000u);

  auto rejected = withdraw(donor_, 1);
  expect_program_error(rejected, program_error_code::unauthorized);
  EXPECT_EQ(balance(campaign_), kReserve + 100'000);
}

TEST_F(campaign_program_test, create_initializes_record_and_funds_reserve) {
  ASSERT_FALSE(create(creator_, "Build a well", "Clean water").error.has_value());
  auto value = record();
  EXPECT_EQ(value.name, "Build a well");
  EXPECT_EQ(value.description, "Clean water");
  EXPECT_EQ(value.amount_donated, 0u);
  EXPECT_EQ(value.admin, creator_);

  const auto& account = committed_.at(campaign_);
  EXPECT_EQ(account.owner, crowdfund::address::program_id());
  EXPECT_EQ(account.data.size(), 656u);
  EXPECT_EQ(account.lamports, kReserve);
  EXPECT_EQ(balance(creator_), kCreatorFunds - kReserve);
}

TEST_F(campaign_program_test, create_twice_fails_and_keeps_first_record) {
  ASSERT_FALSE(create(creator_, "first", "one").error.has_value());
  expect_runtime_error(create(creator_, "second", "two"),
                       transaction_error_code::account_already_in_use);
  EXPECT_EQ(record().name, "first");
  EXPECT_EQ(balance(creator_), kCreatorFunds - kReserve);
}

TEST_F(campaign_program_test, create_succeeds_on_prefunded_derived_address) {
  auto third_party = crowdfund::testing::make_pubkey(3);
  committed_[third_party] = crowdfund::schema::account_t{.lamports = 5'000};

  // A zero transfer leaves the derived address untouched.
  auto nothing = run([&](auto& context) {
    return context.accounts.transfer(third_party, campaign_, 0);
  });
  ASSERT_FALSE(nothing.error.has_value());
  EXPECT_EQ(committed_.count(campaign_), 0u);

  auto gift = run([&](auto& context) {
    return context.accounts.transfer(third_party, campaign_, 1'000);
  });
  ASSERT_FALSE(gift.error.has_value());
  ASSERT_EQ(balance(campaign_), 1'000u);

  ASSERT_FALSE(create(creator_, "Build a well", "Clean water").error.has_value());
  EXPECT_EQ(record().name, "Build a well");
  EXPECT_EQ(record().admin, creator_);
  EXPECT_EQ(committed_.at(campaign_).owner, crowdfund::address::program_id());
  // The gifted lamports stay and count towards the reserve.
  EXPECT_EQ(balance(campaign_), kReserve);
  EXPECT_EQ(balance(creator_), kCreatorFunds - (kReserve - 1'000));
}

TEST_F(campaign_program_test, create_rejects_address_not_derived_from_requester) {
  auto instruction = crowdfund::schema::create_campaign_t{};
  instruction.campaign = crowdfund::address::campaign_address(donor_);
  instruction.name = "stolen";
  auto result = run([&](auto& context) {
    return crowdfund::program::create(context, creator_, instruction);
  });
  expect_runtime_error(result, transaction_error_code::constraint_seeds);
  EXPECT_EQ(committed_.count(instruction.campaign), 0u);
}

TEST_F(campaign_program_test, create_with_oversize_text_leaves_no_account) {
  expect_runtime_error(
      create(creator_, std::string(100, 'n'), std::string(501, 'd')),
      transaction_error_code::account_data_too_small);
  EXPECT_EQ(committed_.count(campaign_), 0u);
  EXPECT_EQ(balance(creator_), kCreatorFunds);
}

TEST_F(campaign_program_test, create_with_bounded_text_at_capacity_succeeds) {
  ASSERT_FALSE(create(creator_, std::string(100, 'n'), std::string(500, 'd'))
                   .error.has_value());
  EXPECT_EQ(record().description.size(), 500u);
}

TEST_F(campaign_program_test, create_requires_reserve_funds) {
  auto poor = crowdfund::testing::make_pubkey(3);
  committed_[poor] = crowdfund::schema::account_t{.lamports = kReserve - 1};
  expect_runtime_error(create(poor, "x", "y"),
                       transaction_error_code::insufficient_lamports);
  EXPECT_EQ(balance(poor), kReserve - 1);
}

TEST_F(campaign_program_test, donate_accumulates_lifetime_total) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  ASSERT_FALSE(donate(donor_, 300).error.has_value());
  ASSERT_FALSE(donate(creator_, 700).error.has_value());
  ASSERT_FALSE(donate(donor_, 0).error.has_value());
  EXPECT_EQ(record().amount_donated, 1000u);
  EXPECT_EQ(balance(campaign_), kReserve + 1000);
  EXPECT_EQ(balance(donor_), kDonorFunds - 300);
}

TEST_F(campaign_program_test, donate_without_funds_changes_nothing) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  expect_runtime_error(donate(donor_, kDonorFunds + 1),
                       transaction_error_code::insufficient_lamports);
  EXPECT_EQ(record().amount_donated, 0u);
  EXPECT_EQ(balance(campaign_), kReserve);
  EXPECT_EQ(balance(donor_), kDonorFunds);
}

TEST_F(campaign_program_test, donate_requires_an_initialized_campaign) {
  expect_runtime_error(donate(donor_, 1),
                       transaction_error_code::account_not_found);

  committed_[campaign_] = crowdfund::schema::account_t{.lamports = 1};
  expect_runtime_error(donate(donor_, 1),
                       transaction_error_code::invalid_account_owner);

  committed_[campaign_] = crowdfund::schema::account_t{
      .lamports = kReserve,
      .owner = crowdfund::address::program_id(),
      .data = crowdfund::schema::bytes_t(656, 0)};
  expect_runtime_error(donate(donor_, 1),
                       transaction_error_code::invalid_account_data);
  EXPECT_EQ(balance(donor_), kDonorFunds);
}

TEST_F(campaign_program_test, donate_detects_counter_overflow) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  auto value = record();
  value.amount_donated = std::numeric_limits<uint64_t>::max() - 10;
  ASSERT_TRUE(crowdfund::schema::layout::write(value, committed_[campaign_].data));

  expect_runtime_error(donate(donor_, 11),
                       transaction_error_code::arithmetic_overflow);
  EXPECT_EQ(balance(donor_), kDonorFunds);
  EXPECT_EQ(balance(campaign_), kReserve);
}

TEST_F(campaign_program_test, withdraw_is_bounded_by_reserve) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  ASSERT_FALSE(donate(donor_, 100'000).error.has_value());

  expect_program_error(withdraw(creator_, 100'001),
                       program_error_code::insufficient_funds);
  EXPECT_EQ(balance(campaign_), kReserve + 100'000);

  ASSERT_FALSE(withdraw(creator_, 100'000).error.has_value());
  EXPECT_EQ(balance(campaign_), kReserve);
  EXPECT_EQ(record().amount_donated, 100'000u);

  expect_program_error(withdraw(creator_, 1),
                       program_error_code::insufficient_funds);
}

TEST_F(campaign_program_test, unauthorized_is_reported_before_insufficient_funds) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  expect_program_error(withdraw(donor_, kCreatorFunds),
                       program_error_code::unauthorized);
}

TEST_F(campaign_program_test, balance_below_reserve_counts_as_nothing_available) {
  ASSERT_FALSE(create(creator_, "a", "b").error.has_value());
  committed_[campaign_].lamports = kReserve - 10;

  expect_program_error(withdraw(creator_, 1),
                       program_error_code::insufficient_funds);
  EXPECT_FALSE(withdraw(creator_, 0).error.has_value());
  EXPECT_EQ(balance(campaign_), kReserve - 10);
}
