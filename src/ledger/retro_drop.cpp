// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "retro_drop.hpp"

#include "math.hpp"
#include "vesting.hpp"

namespace custody::ledger {
    namespace {
        auto make_state(const std::shared_ptr<logging::log>& log,
                        const evmc::address& admin,
                        const evmc::address& signer,
                        std::shared_ptr<asset_transport> transport)
            -> retro_drop_state {
            auto j = std::make_shared<journal>();
            auto s = retro_drop_state{
                j,
                role_gate(j, admin),
                replay_guard(j, error_code::sign_id_already_used),
                asset_ledger(j, std::move(transport), log)};
            s.m_roles.grant(signer_role(), signer);
            s.m_roles.grant(withdraw_role(), admin);
            return s;
        }
    }

    retro_drop::retro_drop(std::shared_ptr<logging::log> log,
                           const config& cfg,
                           const asset_id& token,
                           const evmc::address& admin,
                           const evmc::address& signer,
                           std::shared_ptr<signature_authority> authority,
                           std::shared_ptr<asset_transport> transport,
                           std::shared_ptr<lock_escrow> escrow)
        : front_end(log,
                    cfg.m_contract_address,
                    std::move(authority),
                    make_state(log, admin, signer, std::move(transport))),
          m_token(token),
          m_chain_id(cfg.m_chain_id),
          m_max_lock_weeks(cfg.m_max_lock_weeks),
          m_escrow(std::move(escrow)) {}

    auto retro_drop::claim(const call_context& ctx,
                           const evmc::uint256be& sign_id,
                           const evmc::uint256be& max_amount,
                           uint64_t lock_weeks,
                           uint64_t deadline,
                           const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::drop_claim;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_value = max_amount;
        v.m_deadline = deadline;
        v.m_chain_id = m_chain_id;
        v.m_contract = m_contract;
        return m_exec.run("drop_claim", [&](retro_drop_state& s) {
            auto res = calculate_amount(max_amount, lock_weeks);
            if(std::holds_alternative<error_code>(res)) {
                return std::optional<error_code>(std::get<error_code>(res));
            }
            const auto amount = std::get<evmc::uint256be>(res);
            if(auto err = verify_voucher(s, v, sig, ctx.m_timestamp)) {
                return err;
            }
            if(auto err = s.m_replay.mark_used(sign_id)) {
                return err;
            }

            if(lock_weeks == 0) {
                m_exec.emit(drop_claimed{ctx.m_sender,
                                         sign_id,
                                         max_amount,
                                         lock_weeks,
                                         amount,
                                         {}});
                return s.m_ledger.transfer_out(m_token, ctx.m_sender, amount);
            }

            if(auto err = s.m_ledger.debit(m_token, amount)) {
                return err;
            }
            auto token_id = m_escrow->create_lock_for(
                m_token,
                amount,
                lock_weeks * seconds_per_week,
                ctx.m_sender);
            if(!token_id.has_value()) {
                m_log->error("Escrow rejected lock for",
                             to_hex(ctx.m_sender));
                return std::optional<error_code>(error_code::transfer_failed);
            }
            m_log->info("Locked",
                        to_decimal(amount),
                        "for",
                        lock_weeks,
                        "weeks, position",
                        to_decimal(token_id.value()));
            m_exec.emit(drop_claimed{ctx.m_sender,
                                     sign_id,
                                     max_amount,
                                     lock_weeks,
                                     amount,
                                     token_id.value()});
            return std::optional<error_code>();
        });
    }

    auto retro_drop::calculate_amount(const evmc::uint256be& max_amount,
                                      uint64_t lock_weeks) const
        -> std::variant<evmc::uint256be, error_code> {
        return vested_amount(max_amount, lock_weeks, m_max_lock_weeks);
    }

    auto retro_drop::preview_claim(const evmc::uint256be& max_amount,
                                   uint64_t lock_weeks) const
        -> evmc::uint256be {
        return preview_amount(max_amount, lock_weeks, m_max_lock_weeks);
    }

    auto retro_drop::withdraw(const call_context& ctx,
                              const evmc::address& to,
                              const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("withdraw", [&](retro_drop_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            m_exec.emit(withdrawn{to, m_token, amount, {}});
            return s.m_ledger.transfer_out(m_token, to, amount);
        });
    }

    auto retro_drop::withdraw_all(const call_context& ctx)
        -> exec_return_type {
        return m_exec.run("withdraw_all", [&](retro_drop_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            auto amount = s.m_ledger.balance(m_token);
            m_exec.emit(withdrawn{ctx.m_sender, m_token, amount, {}});
            return s.m_ledger.transfer_out(m_token, ctx.m_sender, amount);
        });
    }

    auto retro_drop::reconcile(const call_context& /* ctx */)
        -> exec_return_type {
        return m_exec.run("reconcile", [&](retro_drop_state& s) {
            auto res = s.m_ledger.reconcile(m_token);
            if(std::holds_alternative<error_code>(res)) {
                m_log->error("Token custody is below the book balance");
                return std::optional<error_code>(std::get<error_code>(res));
            }
            const auto& surplus = std::get<evmc::uint256be>(res);
            if(!evmc::is_zero(surplus)) {
                m_exec.emit(topup{evmc::address{}, m_token, surplus});
            }
            return std::optional<error_code>();
        });
    }

    auto retro_drop::balance() const -> evmc::uint256be {
        return m_exec.state().m_ledger.balance(m_token);
    }

    auto retro_drop::is_used(const evmc::uint256be& sign_id) const -> bool {
        return m_exec.state().m_replay.is_used(sign_id);
    }

    auto retro_drop::token() const -> const asset_id& {
        return m_token;
    }

    auto retro_drop::max_lock_weeks() const -> uint64_t {
        return m_max_lock_weeks;
    }
}
