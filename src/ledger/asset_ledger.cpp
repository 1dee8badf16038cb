// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "asset_ledger.hpp"

#include "math.hpp"
#include "util.hpp"

namespace custody::ledger {
    asset_ledger::asset_ledger(std::shared_ptr<journal> j,
                               std::shared_ptr<asset_transport> transport,
                               std::shared_ptr<logging::log> log)
        : m_journal(std::move(j)),
          m_transport(std::move(transport)),
          m_log(std::move(log)) {}

    auto asset_ledger::balance(const asset_id& asset) const
        -> evmc::uint256be {
        auto it = m_balances.find(asset);
        if(it == m_balances.end()) {
            return {};
        }
        return it->second;
    }

    auto asset_ledger::credit(const asset_id& asset,
                              const evmc::uint256be& amount)
        -> std::optional<error_code> {
        auto new_bal = checked_add(balance(asset), amount);
        if(!new_bal.has_value()) {
            return error_code::arithmetic_overflow;
        }
        m_journal->put(m_balances, asset, new_bal.value());
        return std::nullopt;
    }

    auto asset_ledger::debit(const asset_id& asset,
                             const evmc::uint256be& amount)
        -> std::optional<error_code> {
        auto new_bal = checked_sub(balance(asset), amount);
        if(!new_bal.has_value()) {
            return error_code::insufficient_balance;
        }
        m_journal->put(m_balances, asset, new_bal.value());
        return std::nullopt;
    }

    auto asset_ledger::accept(const asset_id& asset,
                              const evmc::address& from,
                              const evmc::uint256be& amount)
        -> std::variant<evmc::uint256be, error_code> {
        if(evmc::is_zero(amount)) {
            return amount;
        }
        auto before = m_transport->custody_balance(asset);
        if(!m_transport->pull(asset, from, amount)) {
            return error_code::transfer_failed;
        }
        auto after = m_transport->custody_balance(asset);
        auto received = checked_sub(after, before);
        if(!received.has_value()) {
            return error_code::accounting_drift;
        }
        const auto got = received.value();
        // Recorded before the credit so the credit is unwound first.
        m_journal->record([this, asset, from, got]() {
            return_funds(asset, from, got);
        });
        if(auto err = credit(asset, got)) {
            return err.value();
        }
        return got;
    }

    auto asset_ledger::transfer_out(const asset_id& asset,
                                    const evmc::address& to,
                                    const evmc::uint256be& amount)
        -> std::optional<error_code> {
        if(to == evmc::address{}) {
            return error_code::zero_address;
        }
        if(evmc::is_zero(amount)) {
            return error_code::zero_value;
        }
        if(balance(asset) < amount) {
            return error_code::insufficient_balance;
        }
        auto pushed = std::make_shared<bool>(false);
        m_journal->record([this, pushed, asset, to, amount]() {
            if(*pushed) {
                claw_back(asset, to, amount);
            }
        });
        if(auto err = debit(asset, amount)) {
            return err;
        }
        if(!m_transport->push(asset, to, amount)) {
            return error_code::transfer_failed;
        }
        *pushed = true;
        return std::nullopt;
    }

    auto asset_ledger::reconcile(const asset_id& asset)
        -> std::variant<evmc::uint256be, error_code> {
        auto held = m_transport->custody_balance(asset);
        auto surplus = checked_sub(held, balance(asset));
        if(!surplus.has_value()) {
            return error_code::accounting_drift;
        }
        m_journal->put(m_balances, asset, held);
        return surplus.value();
    }

    void asset_ledger::return_funds(const asset_id& asset,
                                    const evmc::address& to,
                                    const evmc::uint256be& amount) {
        if(m_transport->push(asset, to, amount)) {
            return;
        }
        // The funds stay in custody, so they stay on the books.
        m_log->error("Could not return",
                     to_decimal(amount),
                     "of",
                     to_hex(asset),
                     "to",
                     to_hex(to));
        m_balances[asset] = balance(asset) + amount;
    }

    void asset_ledger::claw_back(const asset_id& asset,
                                 const evmc::address& from,
                                 const evmc::uint256be& amount) {
        auto before = m_transport->custody_balance(asset);
        auto recovered = evmc::uint256be{};
        if(m_transport->pull(asset, from, amount)) {
            recovered = checked_sub(m_transport->custody_balance(asset),
                                    before)
                            .value_or(evmc::uint256be{});
        }
        if(recovered == amount) {
            return;
        }
        // Whatever could not be recovered has left custody for good.
        m_log->error("Recovered",
                     to_decimal(recovered),
                     "of",
                     to_decimal(amount),
                     "of",
                     to_hex(asset),
                     "sent to",
                     to_hex(from));
        m_balances[asset] = checked_sub(balance(asset), amount - recovered)
                                .value_or(evmc::uint256be{});
    }
}
