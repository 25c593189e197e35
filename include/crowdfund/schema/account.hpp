#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <cstdint>

// Schema type: account.
// Crowdfund workflow: Unit of host storage. Wallets are system owned with
// empty data, campaign records are program owned with fixed size data.
namespace crowdfund::schema {

/// Owner id of plain wallets created by genesis and system transfers.
inline constexpr auto kSystemProgramId = program_id_t{};

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  lamports_t lamports{};
  program_id_t owner{};
  bytes_t data;
};

using account_t = account<1>;

}  // namespace crowdfund::schema
