#pragma once
#include <crowdfund/runtime/error.hpp>
#include <crowdfund/runtime/invocation_context.hpp>
#include <crowdfund/schema/create_campaign.hpp>
#include <crowdfund/schema/donate.hpp>
#include <crowdfund/schema/withdraw.hpp>
#include <optional>

// The campaign ledger program. Each entry point either completes or returns
// the error that aborted it; the caller discards the context's writes on
// error.
namespace crowdfund::program {

inline constexpr auto kCampaignCreatedLog =
    std::string_view{"Campaign created successfully"};
inline constexpr auto kDonationLog = std::string_view{"Donation successful"};
inline constexpr auto kWithdrawalLog = std::string_view{"Withdrawal successful"};

/// Allocate and initialize the requester's campaign record.
std::optional<crowdfund::runtime::error> create(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& requester,
    const crowdfund::schema::create_campaign_t& instruction);

/// Move lamports from the donor into a campaign. Open to any signer.
std::optional<crowdfund::runtime::error> donate(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& donor,
    const crowdfund::schema::donate_t& instruction);

/// Pay lamports above the campaign's rent minimum out to its admin.
std::optional<crowdfund::runtime::error> withdraw(
    crowdfund::runtime::invocation_context& context,
    const crowdfund::schema::pubkey_t& requester,
    const crowdfund::schema::withdraw_t& instruction);

}  // namespace crowdfund::program
