#include <spdlog/spdlog.h>
#include <crowdfund/address/derive.hpp>
#include <crowdfund/program/campaign_program.hpp>
#include <crowdfund/schema/layout/campaign.hpp>
#include <limits>

namespace crowdfund::program {

namespace {

using crowdfund::schema::transaction_error_code;

struct loaded_campaign final {
  crowdfund::schema::account_t account;
  crowdfund::schema::campaign_t record;
};

// Load an account that must hold a campaign record owned by this program.
std::optional<crowdfund::runtime::error> load_campaign(
    const crowdfund::runtime::account_store& accounts,
    const crowdfund::schema::address_t& address,
    loaded_campaign& out) {
  auto account = accounts.load(address);
  if (!account) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::account_not_found,
        "campaign account " + crowdfund::schema::to_hex(address) +
            " not found");
  }
  if (account->owner != crowdfund::address::program_id()) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::invalid_account_owner,
        "campaign account is not owned by the campaign program");
  }
  auto record = crowdfund::schema::layout::read(crowdfund::schema::bytes_view_t{
      account->data.data(), account->data.size()});
  if (!record) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::invalid_account_data,
        "campaign account does not hold a campaign record");
  }
  out.account = std::move(*account);
  out.record = std::move(*record);
  return std::nullopt;
}

crowdfund::schema::transaction_event_attribute_t attribute(std::string key,
                                                           std::string value) {
  return crowdfund::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

}  // namespace

std::optional<crowdfund::runtime::error> create(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& requester,
    const crowdfund::schema::create_campaign_t& instruction) {
  auto expected = crowdfund::address::campaign_address(requester);
  if (instruction.campaign != expected) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::constraint_seeds,
        "campaign address does not match the requester's derived address");
  }

  if (auto error = context.accounts.allocate(
          instruction.campaign, crowdfund::schema::layout::kCampaignAccountSize,
          requester, crowdfund::address::program_id())) {
    return error;
  }

  auto account = context.accounts.load(instruction.campaign);
  if (!account) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::account_not_found,
        "allocated campaign account missing");
  }
  auto record = crowdfund::schema::campaign_t{};
  record.name = instruction.name;
  record.description = instruction.description;
  record.amount_donated = 0;
  record.admin = requester;
  if (!crowdfund::schema::layout::write(record, account->data)) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::account_data_too_small,
        fmt::format("campaign record needs {} bytes, account holds {}",
                    crowdfund::schema::layout::serialized_size(record),
                    account->data.size()));
  }
  context.accounts.store(instruction.campaign, std::move(*account));

  context.log(std::string{kCampaignCreatedLog});
  context.emit("campaign_created",
               {attribute("campaign", crowdfund::schema::to_hex(
                                          instruction.campaign)),
                attribute("admin", crowdfund::schema::to_hex(requester))});
  return std::nullopt;
}

std::optional<crowdfund::runtime::error> donate(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& donor,
    const crowdfund::schema::donate_t& instruction) {
  auto campaign = loaded_campaign{};
  if (auto error =
          load_campaign(context.accounts, instruction.campaign, campaign)) {
    return error;
  }

  if (auto error = context.accounts.transfer(donor, instruction.campaign,
                                             instruction.amount)) {
    return error;
  }

  // The transfer moved the balance; pick the account up again before writing.
  auto account = context.accounts.load(instruction.campaign);
  if (!account) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::account_not_found,
        "campaign account vanished during donation");
  }
  if (campaign.record.amount_donated >
      std::numeric_limits<uint64_t>::max() - instruction.amount) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::arithmetic_overflow,
        "amount_donated overflow");
  }
  campaign.record.amount_donated += instruction.amount;
  if (!crowdfund::schema::layout::write(campaign.record, account->data)) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::account_data_too_small,
        "campaign record no longer fits its account");
  }
  context.accounts.store(instruction.campaign, std::move(*account));

  context.log(std::string{kDonationLog});
  context.emit(
      "donation",
      {attribute("campaign", crowdfund::schema::to_hex(instruction.campaign)),
       attribute("donor", crowdfund::schema::to_hex(donor)),
       attribute("amount", std::to_string(instruction.amount))});
  return std::nullopt;
}

std::optional<crowdfund::runtime::error> withdraw(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& requester,
    const crowdfund::schema::withdraw_t& instruction) {
  auto campaign = loaded_campaign{};
  if (auto error =
          load_campaign(context.accounts, instruction.campaign, campaign)) {
    return error;
  }

  if (campaign.record.admin != requester) {
    return crowdfund::runtime::make_program_error(
        crowdfund::schema::program_error_code::unauthorized);
  }

  auto reserve =
      context.accounts.rent().minimum_balance(campaign.account.data.size());
  if (!reserve) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::arithmetic_overflow,
        "campaign reserve overflow");
  }
  auto available = campaign.account.lamports > *reserve
                       ? campaign.account.lamports - *reserve
                       : crowdfund::schema::lamports_t{0};
  if (available < instruction.amount) {
    return crowdfund::runtime::make_program_error(
        crowdfund::schema::program_error_code::insufficient_funds);
  }

  auto recipient = context.accounts.load(requester).value_or(
      crowdfund::schema::account_t{.lamports = 0,
                                   .owner = crowdfund::schema::kSystemProgramId});
  if (recipient.lamports >
      std::numeric_limits<uint64_t>::max() - instruction.amount) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::arithmetic_overflow,
        "requester balance overflow");
  }
  campaign.account.lamports -= instruction.amount;
  recipient.lamports += instruction.amount;
  context.accounts.store(instruction.campaign, std::move(campaign.account));
  context.accounts.store(requester, std::move(recipient));

  context.log(std::string{kWithdrawalLog});
  context.emit(
      "withdrawal",
      {attribute("campaign", crowdfund::schema::to_hex(instruction.campaign)),
       attribute("admin", crowdfund::schema::to_hex(requester)),
       attribute("amount", std::to_string(instruction.amount))});
  return std::nullopt;
}

}  // namespace crowdfund::program
