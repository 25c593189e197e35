#pragma once
#include <crowdfund/runtime/error.hpp>
#include <crowdfund/schema/account.hpp>
#include <crowdfund/schema/rent.hpp>
#include <functional>
#include <map>
#include <optional>

namespace crowdfund::runtime {

/// Resolves accounts that are not in the overlay (pending block writes, then
/// committed storage).
using account_loader_t = std::function<std::optional<crowdfund::schema::account_t>(
    const crowdfund::schema::address_t&)>;

/// Per-invocation view of ledger accounts.
///
/// Writes land in a private overlay. The caller merges `changes()` into the
/// block only when the whole invocation succeeded, so a failure at any step
/// leaves no partial state behind.
class account_store final {
 public:
  account_store(const crowdfund::schema::rent_t& rent, account_loader_t loader);

  std::optional<crowdfund::schema::account_t> load(
      const crowdfund::schema::address_t& address) const;

  void store(const crowdfund::schema::address_t& address,
             crowdfund::schema::account_t account);

  /// Create a zero filled account of `size` bytes at `address`, owned by
  /// `owner`. `funder` tops the balance up to the rent minimum. An address
  /// that only holds a plain wallet is taken over with its lamports; one that
  /// holds data or belongs to another program is in use.
  std::optional<error> allocate(const crowdfund::schema::address_t& address,
                                std::size_t size,
                                const crowdfund::schema::address_t& funder,
                                const crowdfund::schema::program_id_t& owner);

  /// System transfer between accounts. The source must be a system owned
  /// wallet without data; a missing destination is created as a wallet.
  /// Zero amounts and self transfers write nothing.
  std::optional<error> transfer(const crowdfund::schema::address_t& from,
                                const crowdfund::schema::address_t& to,
                                crowdfund::schema::lamports_t amount);

  const crowdfund::schema::rent_t& rent() const;

  const std::map<crowdfund::schema::address_t, crowdfund::schema::account_t>&
  changes() const;

 private:
  crowdfund::schema::rent_t rent_;
  account_loader_t loader_;
  std::map<crowdfund::schema::address_t, crowdfund::schema::account_t> overlay_;
};

}  // namespace crowdfund::runtime
