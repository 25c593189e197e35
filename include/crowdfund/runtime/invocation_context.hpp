#pragma once
#include <crowdfund/runtime/account_store.hpp>
#include <crowdfund/schema/transaction_event.hpp>
#include <string>
#include <vector>

namespace crowdfund::runtime {

/// What a program sees while handling one instruction: the accounts, plus the
/// log lines and events it reports back in the transaction result.
struct invocation_context final {
  explicit invocation_context(account_store& store) : accounts{store} {}

  account_store& accounts;
  std::vector<std::string> logs;
  std::vector<crowdfund::schema::transaction_event_t> events;

  /// Record a program log line ("Program log: ...").
  void log(std::string message);

  void emit(std::string type,
            std::vector<crowdfund::schema::transaction_event_attribute_t>
                attributes);
};

}  // namespace crowdfund::runtime
