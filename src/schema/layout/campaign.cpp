#include <boost/endian/buffers.hpp>
#include <crowdfund/blake3/hash.hpp>
#include <crowdfund/schema/layout/campaign.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string_view>

namespace crowdfund::schema::layout {

namespace {

using u32_buf_t = boost::endian::little_uint32_buf_t;
using u64_buf_t = boost::endian::little_uint64_buf_t;

static_assert(sizeof(u32_buf_t) == kLengthPrefixSize);
static_assert(sizeof(u64_buf_t) == sizeof(uint64_t));

class writer final {
 public:
  explicit writer(uint8_t* out) : out_{out} {}

  void bytes(const uint8_t* data, const std::size_t size) {
    std::memcpy(out_ + offset_, data, size);
    offset_ += size;
  }

  void text(const std::string& value) {
    auto prefix = u32_buf_t{static_cast<uint32_t>(value.size())};
    bytes(prefix.data(), sizeof(prefix));
    bytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
  }

  void u64(const uint64_t value) {
    auto buffer = u64_buf_t{value};
    bytes(buffer.data(), sizeof(buffer));
  }

 private:
  uint8_t* out_;
  std::size_t offset_{};
};

class reader final {
 public:
  explicit reader(const bytes_view_t& in) : in_{in} {}

  bool bytes(uint8_t* out, const std::size_t size) {
    if (size > in_.size() - offset_) {
      return false;
    }
    std::memcpy(out, in_.data() + offset_, size);
    offset_ += size;
    return true;
  }

  bool text(std::string& value) {
    auto prefix = u32_buf_t{};
    if (!bytes(prefix.data(), sizeof(prefix))) {
      return false;
    }
    auto size = static_cast<std::size_t>(prefix.value());
    if (size > in_.size() - offset_) {
      return false;
    }
    value.assign(reinterpret_cast<const char*>(in_.data() + offset_), size);
    offset_ += size;
    return true;
  }

  bool u64(uint64_t& value) {
    auto buffer = u64_buf_t{};
    if (!bytes(buffer.data(), sizeof(buffer))) {
      return false;
    }
    value = buffer.value();
    return true;
  }

 private:
  bytes_view_t in_;
  std::size_t offset_{};
};

}  // namespace

const discriminator_t& campaign_discriminator() {
  static const auto discriminator = [] {
    auto digest = crowdfund::blake3::hash(std::string_view{"account:Campaign"});
    auto out = discriminator_t{};
    std::copy_n(std::begin(digest), out.size(), std::begin(out));
    return out;
  }();
  return discriminator;
}

std::size_t serialized_size(const campaign_t& value) {
  return kDiscriminatorSize + kLengthPrefixSize + value.name.size() +
         kLengthPrefixSize + value.description.size() + sizeof(uint64_t) +
         value.admin.size();
}

bool write(const campaign_t& value, bytes_t& account_data) {
  if (value.name.size() > UINT32_MAX || value.description.size() > UINT32_MAX ||
      serialized_size(value) > account_data.size()) {
    return false;
  }
  std::fill(std::begin(account_data), std::end(account_data), uint8_t{0});

  auto out = writer{account_data.data()};
  const auto& discriminator = campaign_discriminator();
  out.bytes(discriminator.data(), discriminator.size());
  out.text(value.name);
  out.text(value.description);
  out.u64(value.amount_donated);
  out.bytes(value.admin.data(), value.admin.size());
  return true;
}

std::optional<campaign_t> read(const bytes_view_t& account_data) {
  auto in = reader{account_data};
  auto discriminator = discriminator_t{};
  if (!in.bytes(discriminator.data(), discriminator.size()) ||
      discriminator != campaign_discriminator()) {
    return std::nullopt;
  }

  auto value = campaign_t{};
  if (!in.text(value.name) || !in.text(value.description) ||
      !in.u64(value.amount_donated) ||
      !in.bytes(value.admin.data(), value.admin.size())) {
    return std::nullopt;
  }
  return value;
}

}  // namespace crowdfund::schema::layout
