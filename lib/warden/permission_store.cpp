// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "permission_store.hpp"
#include <algorithm>
#include <type_traits>
#include <utility>

namespace warden
{
namespace
{
template <typename Map, typename Key>
auto find_value(const Map& map, const Key& key) -> const typename Map::mapped_type*
{
    const auto it = map.find(key);
    return it != map.end() ? &it->second : nullptr;
}

template <typename Map, typename Key>
auto optional_value(const Map& map, const Key& key) -> std::optional<typename Map::mapped_type>
{
    if (const auto* v = find_value(map, key); v != nullptr)
        return *v;
    return std::nullopt;
}
}  // namespace

bytes32 PermissionStore::spending_limit_key(const address& op, const address& token)
{
    uint8_t buffer[2 * sizeof(address)];
    std::copy_n(op.bytes, sizeof(op), buffer);
    std::copy_n(token.bytes, sizeof(token), &buffer[sizeof(op)]);
    return keccak256({buffer, sizeof(buffer)});
}

bytes32 PermissionStore::session_key(const address& op, const hash256& leaf)
{
    uint8_t buffer[sizeof(address) + sizeof(hash256)];
    std::copy_n(op.bytes, sizeof(op), buffer);
    std::copy_n(leaf.bytes, sizeof(leaf), &buffer[sizeof(op)]);
    return keccak256({buffer, sizeof(buffer)});
}

const PermissionStore::WalletTables* PermissionStore::find(const address& wallet) const noexcept
{
    return find_value(m_wallets, wallet);
}

OperatorPermission PermissionStore::get_permission(const address& wallet, const address& op) const
{
    if (const auto* w = find(wallet); w != nullptr)
    {
        if (const auto* p = find_value(w->permissions, op); p != nullptr)
            return *p;
    }
    return {};
}

void PermissionStore::set_permission(
    const address& wallet, const address& op, const OperatorPermission& p)
{
    auto& permissions = m_wallets[wallet].permissions;
    m_journal.emplace_back(JournalPermissionChange{{wallet}, op, optional_value(permissions, op)});
    permissions[op] = p;
}

SpendingLimit PermissionStore::get_spending_limit(
    const address& wallet, const address& op, const address& token) const
{
    if (const auto* w = find(wallet); w != nullptr)
    {
        if (const auto* l = find_value(w->spending_limits, spending_limit_key(op, token));
            l != nullptr)
            return *l;
    }
    return {};
}

void PermissionStore::set_spending_limit(
    const address& wallet, const address& op, const address& token, const SpendingLimit& limit)
{
    auto& limits = m_wallets[wallet].spending_limits;
    const auto key = spending_limit_key(op, token);
    m_journal.emplace_back(JournalSpendingLimitChange{{wallet}, key, optional_value(limits, key)});
    limits[key] = limit;
}

void PermissionStore::delete_spending_limit(
    const address& wallet, const address& op, const address& token)
{
    auto& limits = m_wallets[wallet].spending_limits;
    const auto key = spending_limit_key(op, token);
    const auto it = limits.find(key);
    if (it == limits.end())
        return;
    m_journal.emplace_back(JournalSpendingLimitChange{{wallet}, key, it->second});
    limits.erase(it);
}

intx::uint256 PermissionStore::get_session_uses(
    const address& wallet, const address& op, const hash256& leaf) const
{
    if (const auto* w = find(wallet); w != nullptr)
    {
        if (const auto* n = find_value(w->session_uses, session_key(op, leaf)); n != nullptr)
            return *n;
    }
    return 0;
}

void PermissionStore::record_session_use(
    const address& wallet, const address& op, const hash256& leaf)
{
    const auto key = session_key(op, leaf);
    ++m_wallets[wallet].session_uses[key];
    m_journal.emplace_back(JournalSessionUse{{wallet}, key});
}

intx::uint256 PermissionStore::get_permit_nonce(const address& wallet, const address& op) const
{
    if (const auto* w = find(wallet); w != nullptr)
    {
        if (const auto* n = find_value(w->permit_nonces, op); n != nullptr)
            return *n;
    }
    return 0;
}

void PermissionStore::bump_permit_nonce(const address& wallet, const address& op)
{
    ++m_wallets[wallet].permit_nonces[op];
    m_journal.emplace_back(JournalPermitNonceBump{{wallet}, op});
}

bool PermissionStore::is_revoked(const address& wallet, const bytes32& hash) const
{
    const auto* w = find(wallet);
    return w != nullptr && w->revoked.contains(hash);
}

void PermissionStore::revoke(const address& wallet, const bytes32& hash)
{
    if (m_wallets[wallet].revoked.insert(hash).second)
        m_journal.emplace_back(JournalRevocation{{wallet}, hash});
}

void PermissionStore::clear_wallet(const address& wallet)
{
    const auto it = m_wallets.find(wallet);
    if (it == m_wallets.end())
        return;
    auto& w = it->second;
    if (w.permissions.empty() && w.spending_limits.empty() && w.session_uses.empty())
        return;
    m_journal.emplace_back(JournalWalletCleared{{wallet}, std::exchange(w.permissions, {}),
        std::exchange(w.spending_limits, {}), std::exchange(w.session_uses, {})});
}

void PermissionStore::rollback(size_t checkpoint)
{
    while (m_journal.size() != checkpoint)
    {
        std::visit(
            [this](auto& e) {
                using T = std::decay_t<decltype(e)>;
                auto& w = m_wallets[e.wallet];
                if constexpr (std::is_same_v<T, JournalPermissionChange>)
                {
                    if (e.prev.has_value())
                        w.permissions[e.op] = *e.prev;
                    else
                        w.permissions.erase(e.op);
                }
                else if constexpr (std::is_same_v<T, JournalSpendingLimitChange>)
                {
                    if (e.prev.has_value())
                        w.spending_limits[e.key] = *e.prev;
                    else
                        w.spending_limits.erase(e.key);
                }
                else if constexpr (std::is_same_v<T, JournalSessionUse>)
                {
                    if (auto& n = w.session_uses[e.key]; --n == 0)
                        w.session_uses.erase(e.key);
                }
                else if constexpr (std::is_same_v<T, JournalPermitNonceBump>)
                {
                    if (auto& n = w.permit_nonces[e.op]; --n == 0)
                        w.permit_nonces.erase(e.op);
                }
                else if constexpr (std::is_same_v<T, JournalRevocation>)
                {
                    w.revoked.erase(e.hash);
                }
                else if constexpr (std::is_same_v<T, JournalWalletCleared>)
                {
                    w.permissions = std::move(e.permissions);
                    w.spending_limits = std::move(e.spending_limits);
                    w.session_uses = std::move(e.session_uses);
                }
                else
                {
                    static_assert(std::is_void_v<T>, "unhandled journal entry type");
                }
            },
            m_journal.back());
        m_journal.pop_back();
    }
}
}  // namespace warden
