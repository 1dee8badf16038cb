// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "payment_bank.hpp"

#include "math.hpp"

namespace custody::ledger {
    namespace {
        auto make_state(const std::shared_ptr<logging::log>& log,
                        const evmc::address& admin,
                        const evmc::address& signer,
                        std::shared_ptr<asset_transport> transport)
            -> payment_bank_state {
            auto j = std::make_shared<journal>();
            auto s = payment_bank_state{
                j,
                role_gate(j, admin),
                replay_guard(j, error_code::sign_id_already_used),
                asset_ledger(j, std::move(transport), log),
                {}};
            s.m_roles.grant(signer_role(), signer);
            return s;
        }
    }

    payment_bank::payment_bank(
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

    auto payment_bank::use_eth(const call_context& ctx,
                               const evmc::uint256be& sign_id,
                               const evmc::uint256be& value,
                               const evmc::uint256be& param,
                               const evmc::uint256be& fee,
                               uint64_t deadline,
                               const evm_sig& sig) -> exec_return_type {
        auto v = use_voucher(ctx,
                             native_asset,
                             sign_id,
                             value,
                             param,
                             fee,
                             deadline);
        return m_exec.run("use_eth", [&](payment_bank_state& s) {
            return run_use(s, ctx, v, sig);
        });
    }

    auto payment_bank::use_token(const call_context& ctx,
                                 const asset_id& token,
                                 const evmc::uint256be& sign_id,
                                 const evmc::uint256be& value,
                                 const evmc::uint256be& param,
                                 const evmc::uint256be& fee,
                                 uint64_t deadline,
                                 const evm_sig& sig) -> exec_return_type {
        auto v = use_voucher(ctx, token, sign_id, value, param, fee, deadline);
        return m_exec.run("use_token", [&](payment_bank_state& s) {
            if(token == native_asset) {
                return std::optional<error_code>(error_code::zero_address);
            }
            return run_use(s, ctx, v, sig);
        });
    }

    auto payment_bank::use_voucher(const call_context& ctx,
                                   const asset_id& asset,
                                   const evmc::uint256be& sign_id,
                                   const evmc::uint256be& value,
                                   const evmc::uint256be& param,
                                   const evmc::uint256be& fee,
                                   uint64_t deadline) const -> voucher {
        auto v = voucher();
        v.m_layout = voucher_layout::bank_use;
        v.m_sign_id = sign_id;
        v.m_value = value;
        v.m_asset = asset;
        v.m_account = ctx.m_sender;
        v.m_param = param;
        v.m_fee = fee;
        v.m_deadline = deadline;
        v.m_contract = m_contract;
        return v;
    }

    auto payment_bank::run_use(payment_bank_state& s,
                               const call_context& ctx,
                               const voucher& v,
                               const evm_sig& sig)
        -> std::optional<error_code> {
        if(evmc::is_zero(v.m_value)) {
            return error_code::zero_value;
        }
        auto required = v.m_fee;
        if(v.m_asset == native_asset) {
            auto total = checked_add(v.m_value, v.m_fee);
            if(!total.has_value()) {
                return error_code::arithmetic_overflow;
            }
            required = total.value();
        }
        if(ctx.m_value != required) {
            m_log->debug("Payment",
                         to_decimal(v.m_sign_id),
                         "attached",
                         to_decimal(ctx.m_value),
                         "instead of",
                         to_decimal(required));
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
        if(v.m_asset != native_asset) {
            auto accepted = s.m_ledger.accept(v.m_asset,
                                              ctx.m_sender,
                                              v.m_value);
            if(std::holds_alternative<error_code>(accepted)) {
                return std::get<error_code>(accepted);
            }
        }

        m_exec.emit(used{v.m_sign_id,
                         v.m_value,
                         v.m_asset,
                         v.m_account,
                         v.m_param,
                         v.m_fee});
        return std::nullopt;
    }

    auto payment_bank::claim(const call_context& ctx,
                             const asset_id& asset,
                             const evmc::uint256be& sign_id,
                             const evmc::uint256be& value,
                             const evmc::uint256be& fee,
                             uint64_t deadline,
                             const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::bank_claim;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_asset = asset;
        v.m_value = value;
        v.m_fee = fee;
        v.m_deadline = deadline;
        v.m_contract = m_contract;
        return m_exec.run("claim", [&](payment_bank_state& s) {
            if(asset == native_asset) {
                return std::optional<error_code>(error_code::zero_address);
            }
            return run_claim(s, ctx, v, sig);
        });
    }

    auto payment_bank::fee_claim(const call_context& ctx,
                                 const asset_id& asset,
                                 const evmc::uint256be& sign_id,
                                 const evmc::uint256be& value,
                                 const evmc::uint256be& fee,
                                 uint64_t deadline,
                                 const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::fee_claim;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_asset = asset;
        v.m_value = value;
        v.m_fee = fee;
        v.m_deadline = deadline;
        v.m_contract = m_contract;
        return m_exec.run("fee_claim", [&](payment_bank_state& s) {
            return run_claim(s, ctx, v, sig);
        });
    }

    auto payment_bank::run_claim(payment_bank_state& s,
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

        m_exec.emit(claimed{v.m_sign_id,
                            v.m_account,
                            v.m_asset,
                            v.m_value,
                            v.m_deadline});
        return s.m_ledger.transfer_out(v.m_asset, v.m_account, v.m_value);
    }

    auto payment_bank::send(const call_context& ctx,
                            const asset_id& asset,
                            const evmc::address& to,
                            const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("send", [&](payment_bank_state& s) {
            if(auto err = s.m_roles.check_role(operator_role(),
                                               ctx.m_sender)) {
                return err;
            }
            return run_send(s, asset, to, amount);
        });
    }

    auto payment_bank::send_batch(const call_context& ctx,
                                  const asset_id& asset,
                                  const std::vector<evmc::address>& recipients,
                                  const std::vector<evmc::uint256be>& amounts)
        -> exec_return_type {
        return m_exec.run("send_batch", [&](payment_bank_state& s) {
            if(auto err = s.m_roles.check_role(operator_role(),
                                               ctx.m_sender)) {
                return err;
            }
            if(recipients.size() != amounts.size()) {
                return std::optional<error_code>(
                    error_code::arrays_length_mismatch);
            }
            for(size_t i = 0; i < recipients.size(); i++) {
                if(auto err = run_send(s, asset, recipients[i], amounts[i])) {
                    return err;
                }
            }
            return std::optional<error_code>();
        });
    }

    auto payment_bank::run_send(payment_bank_state& s,
                                const asset_id& asset,
                                const evmc::address& to,
                                const evmc::uint256be& amount)
        -> std::optional<error_code> {
        if(to == evmc::address{}) {
            return error_code::zero_address;
        }
        if(evmc::is_zero(amount)) {
            return error_code::zero_value;
        }
        auto it = s.m_send_limits.find(asset);
        if(it == s.m_send_limits.end() || it->second < amount) {
            return error_code::exceeds_token_limit;
        }
        m_exec.emit(sent{asset, to, amount});
        return s.m_ledger.transfer_out(asset, to, amount);
    }

    auto payment_bank::set_send_limit(const call_context& ctx,
                                      const asset_id& asset,
                                      const evmc::uint256be& limit)
        -> exec_return_type {
        return m_exec.run("set_send_limit", [&](payment_bank_state& s) {
            if(auto err = s.m_roles.check_role(admin_role(), ctx.m_sender)) {
                return err;
            }
            s.m_journal->put(s.m_send_limits, asset, limit);
            m_log->info("Send limit of",
                        to_hex(asset),
                        "set to",
                        to_decimal(limit));
            m_exec.emit(send_limit_updated{asset, limit});
            return std::optional<error_code>();
        });
    }

    auto payment_bank::withdraw(const call_context& ctx,
                                const asset_id& asset,
                                const evmc::address& to,
                                const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("withdraw", [&](payment_bank_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            m_exec.emit(withdrawn{to, asset, amount, {}});
            return s.m_ledger.transfer_out(asset, to, amount);
        });
    }

    auto payment_bank::withdraw_all(const call_context& ctx,
                                    const asset_id& asset)
        -> exec_return_type {
        return m_exec.run("withdraw_all", [&](payment_bank_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            auto amount = s.m_ledger.balance(asset);
            m_exec.emit(withdrawn{ctx.m_sender, asset, amount, {}});
            return s.m_ledger.transfer_out(asset, ctx.m_sender, amount);
        });
    }

    auto payment_bank::reconcile(const call_context& /* ctx */,
                                 const asset_id& asset) -> exec_return_type {
        return m_exec.run("reconcile", [&](payment_bank_state& s) {
            auto res = s.m_ledger.reconcile(asset);
            if(std::holds_alternative<error_code>(res)) {
                m_log->error("Custody of",
                             to_hex(asset),
                             "is below the book balance");
                return std::optional<error_code>(std::get<error_code>(res));
            }
            const auto& surplus = std::get<evmc::uint256be>(res);
            if(!evmc::is_zero(surplus)) {
                m_exec.emit(topup{evmc::address{}, asset, surplus});
            }
            return std::optional<error_code>();
        });
    }

    auto payment_bank::balance(const asset_id& asset) const
        -> evmc::uint256be {
        return m_exec.state().m_ledger.balance(asset);
    }

    auto payment_bank::is_used(const evmc::uint256be& sign_id) const
        -> bool {
        return m_exec.state().m_replay.is_used(sign_id);
    }

    auto payment_bank::send_limit(const asset_id& asset) const
        -> evmc::uint256be {
        const auto& limits = m_exec.state().m_send_limits;
        auto it = limits.find(asset);
        if(it == limits.end()) {
            return {};
        }
        return it->second;
    }
}
