#include <spdlog/spdlog.h>
#include <crowdfund/runtime/account_store.hpp>
#include <limits>
#include <utility>

namespace crowdfund::runtime {

namespace {

using crowdfund::schema::transaction_error_code;

bool is_wallet(const crowdfund::schema::account_t& account) {
  return account.owner == crowdfund::schema::kSystemProgramId &&
         account.data.empty();
}

crowdfund::schema::account_t make_wallet() {
  return crowdfund::schema::account_t{.lamports = 0,
                                      .owner = crowdfund::schema::kSystemProgramId};
}

}  // namespace

account_store::account_store(const crowdfund::schema::rent_t& rent,
                             account_loader_t loader)
    : rent_{rent}, loader_{std::move(loader)} {}

std::optional<crowdfund::schema::account_t> account_store::load(
    const crowdfund::schema::address_t& address) const {
  if (auto it = overlay_.find(address); it != std::end(overlay_)) {
    return it->second;
  }
  if (!loader_) {
    return std::nullopt;
  }
  return loader_(address);
}

void account_store::store(const crowdfund::schema::address_t& address,
                          crowdfund::schema::account_t account) {
  overlay_[address] = std::move(account);
}

std::optional<error> account_store::allocate(
    const crowdfund::schema::address_t& address,
    const std::size_t size,
    const crowdfund::schema::address_t& funder,
    const crowdfund::schema::program_id_t& owner) {
  auto existing = load(address);
  if (existing && !is_wallet(*existing)) {
    return make_runtime_error(
        transaction_error_code::account_already_in_use,
        "Allocate: account " + crowdfund::schema::to_hex(address) +
            " already in use");
  }

  auto reserve = rent_.minimum_balance(size);
  if (!reserve) {
    return make_runtime_error(transaction_error_code::arithmetic_overflow,
                              "Allocate: rent reserve overflow");
  }
  // Lamports already sitting on the address count towards the reserve.
  auto held = existing ? existing->lamports : crowdfund::schema::lamports_t{0};
  auto top_up = held < *reserve ? *reserve - held : crowdfund::schema::lamports_t{0};

  auto payer = load(funder);
  if (!payer) {
    return make_runtime_error(transaction_error_code::insufficient_lamports,
                              "Allocate: funder account does not exist");
  }
  if (!is_wallet(*payer)) {
    return make_runtime_error(transaction_error_code::transfer_from_data_account,
                              "Allocate: funder must be a system wallet");
  }
  if (payer->lamports < top_up) {
    return make_runtime_error(
        transaction_error_code::insufficient_lamports,
        fmt::format("Allocate: insufficient lamports {}, need {}",
                    payer->lamports, top_up));
  }

  payer->lamports -= top_up;
  store(funder, std::move(*payer));
  store(address, crowdfund::schema::account_t{
                     .lamports = held + top_up,
                     .owner = owner,
                     .data = crowdfund::schema::bytes_t(size, 0)});
  return std::nullopt;
}

std::optional<error> account_store::transfer(
    const crowdfund::schema::address_t& from,
    const crowdfund::schema::address_t& to,
    const crowdfund::schema::lamports_t amount) {
  auto source = load(from);
  if (!source) {
    return make_runtime_error(transaction_error_code::insufficient_lamports,
                              "Transfer: source account does not exist");
  }
  if (!is_wallet(*source)) {
    return make_runtime_error(transaction_error_code::transfer_from_data_account,
                              "Transfer: `from` must not carry data");
  }
  if (source->lamports < amount) {
    return make_runtime_error(
        transaction_error_code::insufficient_lamports,
        fmt::format("Transfer: insufficient lamports {}, need {}",
                    source->lamports, amount));
  }
  if (from == to || amount == 0) {
    return std::nullopt;
  }

  auto destination = load(to).value_or(make_wallet());
  if (destination.lamports >
      std::numeric_limits<crowdfund::schema::lamports_t>::max() - amount) {
    return make_runtime_error(transaction_error_code::arithmetic_overflow,
                              "Transfer: destination balance overflow");
  }

  source->lamports -= amount;
  destination.lamports += amount;
  store(from, std::move(*source));
  store(to, std::move(destination));
  return std::nullopt;
}

const crowdfund::schema::rent_t& account_store::rent() const {
  return rent_;
}

const std::map<crowdfund::schema::address_t, crowdfund::schema::account_t>&
account_store::changes() const {
  return overlay_;
}

}  // namespace crowdfund::runtime
