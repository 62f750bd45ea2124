#include <strongbox/schema/key/builder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace strongbox::schema::key {

strongbox::schema::bytes_t make_balance_key(
    const strongbox::schema::account_id_t& account,
    const strongbox::schema::asset_id_t& asset) {
  auto key = builder{};
  key.write(kBalanceKeyPrefix)
      .write(std::span{account.data(), account.size()})
      .write(std::span{asset.data(), asset.size()});
  return std::move(key.data);
}

std::optional<
    std::pair<strongbox::schema::account_id_t, strongbox::schema::asset_id_t>>
parse_balance_key(const strongbox::schema::bytes_view_t& key) {
  auto prefix = make_bytes_view(kBalanceKeyPrefix);
  auto account = strongbox::schema::account_id_t{};
  auto asset = strongbox::schema::asset_id_t{};
  if (key.size() != prefix.size() + account.size() + asset.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto cursor = std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size());
  std::copy_n(cursor, account.size(), std::begin(account));
  cursor += static_cast<std::ptrdiff_t>(account.size());
  std::copy_n(cursor, asset.size(), std::begin(asset));
  return std::pair{account, asset};
}

strongbox::schema::bytes_t make_total_key() {
  return make_bytes(kTotalKey);
}

}  // namespace strongbox::schema::key
