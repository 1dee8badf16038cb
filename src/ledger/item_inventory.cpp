// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "item_inventory.hpp"

#include "math.hpp"

namespace custody::ledger {
    namespace {
        auto make_state(const std::shared_ptr<logging::log>& log,
                        const evmc::address& admin,
                        const evmc::address& signer,
                        std::shared_ptr<asset_transport> transport)
            -> item_inventory_state {
            auto j = std::make_shared<journal>();
            auto s = item_inventory_state{
                j,
                role_gate(j, admin),
                replay_guard(j, error_code::sign_id_already_used),
                asset_ledger(j, std::move(transport), log),
                {}};
            s.m_roles.grant(signer_role(), signer);
            s.m_roles.grant(withdraw_role(), admin);
            return s;
        }
    }

    item_inventory::item_inventory(
        std::shared_ptr<logging::log> log,
        const config& cfg,
        const evmc::address& admin,
        const evmc::address& signer,
        std::shared_ptr<signature_authority> authority,
        std::shared_ptr<asset_transport> transport)
        : front_end(log,
                    cfg.m_contract_address,
                    std::move(authority),
                    make_state(log, admin, signer, std::move(transport))) {}

    auto item_inventory::claim(const call_context& ctx,
                               const evmc::uint256be& sign_id,
                               const evmc::uint256be& id,
                               const evmc::uint256be& amount,
                               const evmc::uint256be& fee,
                               uint64_t deadline,
                               const std::vector<uint8_t>& data,
                               const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::inventory_claim;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_item_id = id;
        v.m_value = amount;
        v.m_fee = fee;
        v.m_deadline = deadline;
        v.m_data = data;
        v.m_contract = m_contract;
        return m_exec.run("item_claim", [&](item_inventory_state& s) {
            if(auto err = run_voucher(s, ctx, v, sig)) {
                return err;
            }
            if(auto err = add_items(s, ctx.m_sender, id, amount)) {
                return err;
            }
            m_exec.emit(item_claimed{sign_id, ctx.m_sender, id, amount, data});
            return std::optional<error_code>();
        });
    }

    auto item_inventory::use(const call_context& ctx,
                             const evmc::uint256be& sign_id,
                             const evmc::uint256be& id,
                             const evmc::uint256be& amount,
                             const evmc::uint256be& fee,
                             uint64_t deadline,
                             const std::vector<uint8_t>& data,
                             const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::inventory_use;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_item_id = id;
        v.m_value = amount;
        v.m_fee = fee;
        v.m_deadline = deadline;
        v.m_data = data;
        v.m_contract = m_contract;
        return m_exec.run("item_use", [&](item_inventory_state& s) {
            if(auto err = run_voucher(s, ctx, v, sig)) {
                return err;
            }
            if(auto err = remove_items(s, ctx.m_sender, id, amount)) {
                return err;
            }
            m_exec.emit(item_used{ctx.m_sender, id, amount, data, sign_id});
            return std::optional<error_code>();
        });
    }

    auto item_inventory::run_voucher(item_inventory_state& s,
                                     const call_context& ctx,
                                     const voucher& v,
                                     const evm_sig& sig)
        -> std::optional<error_code> {
        if(evmc::is_zero(v.m_value)) {
            return error_code::zero_value;
        }
        if(ctx.m_value < v.m_fee) {
            return error_code::insufficient_fee;
        }
        if(auto err = verify_voucher(s, v, sig, ctx.m_timestamp)) {
            return err;
        }
        if(auto err = s.m_replay.mark_used(v.m_sign_id)) {
            return err;
        }
        auto attached = s.m_ledger.accept(native_asset,
                                          ctx.m_sender,
                                          ctx.m_value);
        if(std::holds_alternative<error_code>(attached)) {
            return std::get<error_code>(attached);
        }
        return std::nullopt;
    }

    auto item_inventory::mint(const call_context& ctx,
                              const evmc::address& to,
                              const evmc::uint256be& id,
                              const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("mint", [&](item_inventory_state& s) {
            if(auto err = s.m_roles.check_role(minter_role(), ctx.m_sender)) {
                return err;
            }
            if(to == evmc::address{}) {
                return std::optional<error_code>(error_code::zero_address);
            }
            if(evmc::is_zero(amount)) {
                return std::optional<error_code>(error_code::zero_value);
            }
            return add_items(s, to, id, amount);
        });
    }

    auto item_inventory::burn(const call_context& ctx,
                              const evmc::address& account,
                              const evmc::uint256be& id,
                              const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("burn", [&](item_inventory_state& s) {
            if(account != ctx.m_sender) {
                return std::optional<error_code>(
                    error_code::access_control_unauthorized_account);
            }
            return remove_items(s, account, id, amount);
        });
    }

    auto item_inventory::burn_admin(const call_context& ctx,
                                    const evmc::address& account,
                                    const evmc::uint256be& id,
                                    const evmc::uint256be& amount,
                                    const std::vector<uint8_t>& data)
        -> exec_return_type {
        return m_exec.run("burn_admin", [&](item_inventory_state& s) {
            if(auto err = s.m_roles.check_role(burner_role(), ctx.m_sender)) {
                return err;
            }
            if(auto err = remove_items(s, account, id, amount)) {
                return err;
            }
            m_exec.emit(item_used{account, id, amount, data, std::nullopt});
            return std::optional<error_code>();
        });
    }

    auto item_inventory::withdraw(const call_context& ctx,
                                  const evmc::address& to,
                                  const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("withdraw", [&](item_inventory_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            m_exec.emit(withdrawn{to, native_asset, amount, {}});
            return s.m_ledger.transfer_out(native_asset, to, amount);
        });
    }

    auto item_inventory::add_items(item_inventory_state& s,
                                   const evmc::address& account,
                                   const evmc::uint256be& id,
                                   const evmc::uint256be& amount)
        -> std::optional<error_code> {
        auto it = s.m_items.find({account, id});
        auto current = it == s.m_items.end() ? evmc::uint256be{} : it->second;
        auto new_bal = checked_add(current, amount);
        if(!new_bal.has_value()) {
            return error_code::arithmetic_overflow;
        }
        s.m_journal->put(s.m_items, {account, id}, new_bal.value());
        return std::nullopt;
    }

    auto item_inventory::remove_items(item_inventory_state& s,
                                      const evmc::address& account,
                                      const evmc::uint256be& id,
                                      const evmc::uint256be& amount)
        -> std::optional<error_code> {
        auto it = s.m_items.find({account, id});
        auto current = it == s.m_items.end() ? evmc::uint256be{} : it->second;
        auto new_bal = checked_sub(current, amount);
        if(!new_bal.has_value()) {
            return error_code::insufficient_balance;
        }
        if(evmc::is_zero(new_bal.value())) {
            s.m_journal->remove(s.m_items, {account, id});
        } else {
            s.m_journal->put(s.m_items, {account, id}, new_bal.value());
        }
        return std::nullopt;
    }

    auto item_inventory::balance_of(const evmc::address& account,
                                    const evmc::uint256be& id) const
        -> evmc::uint256be {
        const auto& items = m_exec.state().m_items;
        auto it = items.find({account, id});
        if(it == items.end()) {
            return {};
        }
        return it->second;
    }

    auto item_inventory::fees() const -> evmc::uint256be {
        return m_exec.state().m_ledger.balance(native_asset);
    }

    auto item_inventory::is_used(const evmc::uint256be& sign_id) const
        -> bool {
        return m_exec.state().m_replay.is_used(sign_id);
    }
}
