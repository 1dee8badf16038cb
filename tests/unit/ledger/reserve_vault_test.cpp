// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/reserve_vault.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

using namespace custody::ledger;

class reserve_vault_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_cfg.m_contract_address
            = test::make_address("00000000000000000000000000000000000c0ffe");
        m_vault = std::make_unique<reserve_vault>(m_log,
                                                  m_cfg,
                                                  m_admin,
                                                  m_signer,
                                                  m_authority,
                                                  m_transport);
        m_vault->set_event_sink([&](const event& e) {
            m_published.push_back(e);
        });
    }

    auto deposit_voucher(uint64_t sign_id,
                         const asset_id& asset,
                         uint64_t value,
                         uint64_t system_balance) -> voucher {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_deposit;
        v.m_sign_id = evmc::uint256be(sign_id);
        v.m_account = m_user;
        v.m_asset = asset;
        v.m_value = evmc::uint256be(value);
        v.m_deadline = m_deadline;
        v.m_system_balance = evmc::uint256be(system_balance);
        v.m_contract = m_cfg.m_contract_address;
        return v;
    }

    auto claim_voucher(uint64_t sign_id,
                       const evmc::address& recipient,
                       const asset_id& asset,
                       uint64_t value) -> voucher {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_claim;
        v.m_sign_id = evmc::uint256be(sign_id);
        v.m_account = recipient;
        v.m_asset = asset;
        v.m_value = evmc::uint256be(value);
        v.m_contract = m_cfg.m_contract_address;
        return v;
    }

    /// Deposits native currency from the user, signed by the signer.
    auto deposit(uint64_t sign_id, uint64_t value, uint64_t system_balance)
        -> exec_return_type {
        m_transport->fund(native_asset, m_user, evmc::uint256be(value));
        auto v = deposit_voucher(sign_id, native_asset, value, system_balance);
        auto ctx = call_context{m_user, evmc::uint256be(value), m_now};
        return m_vault->deposit(ctx,
                                v.m_sign_id,
                                m_deadline,
                                v.m_system_balance,
                                test::sign(v, m_signer_key));
    }

    std::shared_ptr<custody::logging::log> m_log{
        std::make_shared<custody::logging::log>(
            custody::logging::log_level::trace)};
    config m_cfg{};
    std::shared_ptr<test::memory_transport> m_transport{
        std::make_shared<test::memory_transport>()};
    std::shared_ptr<signature_authority> m_authority{
        std::make_shared<secp256k1_authority>()};
    custody::privkey_t m_signer_key{test::make_key(test::key0)};
    evmc::address m_signer{test::make_address(test::addr0)};
    evmc::address m_user{test::make_address(test::addr1)};
    evmc::address m_admin{test::make_address(test::addr2)};
    asset_id m_token{
        test::make_address("00000000000000000000000000000000000070ce")};
    uint64_t m_now{1000};
    uint64_t m_deadline{2000};
    std::unique_ptr<reserve_vault> m_vault;
    std::vector<event> m_published;
};

TEST_F(reserve_vault_test, deposit_and_claim_native) {
    auto res = deposit(1, 100, 1000);
    ASSERT_FALSE(test::error_of(res).has_value());
    auto events = test::events_of(res);
    ASSERT_EQ(events.size(), 1UL);
    auto dep = std::get<deposited>(events[0]);
    ASSERT_EQ(dep.m_account, m_user);
    ASSERT_EQ(dep.m_value, evmc::uint256be(100));
    ASSERT_EQ(m_published.size(), 1UL);

    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(100));
    ASSERT_EQ(m_vault->deposit_of(m_user, native_asset),
              evmc::uint256be(100));
    ASSERT_TRUE(m_vault->is_used(native_asset, evmc::uint256be(1)));
    ASSERT_EQ(m_vault->last_sign_id(native_asset), evmc::uint256be(1));

    auto v = claim_voucher(2, m_user, native_asset, 40);
    auto claim_res = m_vault->claim(call_context{m_admin, {}, m_now},
                                    v.m_sign_id,
                                    m_user,
                                    v.m_value,
                                    test::sign(v, m_signer_key));
    ASSERT_FALSE(test::error_of(claim_res).has_value());
    auto claim_events = test::events_of(claim_res);
    ASSERT_EQ(claim_events.size(), 1UL);
    ASSERT_TRUE(std::holds_alternative<claimed>(claim_events[0]));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_user),
              evmc::uint256be(40));
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(60));
    ASSERT_TRUE(evmc::is_zero(m_vault->deposit_of(m_user, native_asset)));
}

TEST_F(reserve_vault_test, replayed_deposit_rejected) {
    ASSERT_FALSE(test::error_of(deposit(1, 100, 1000)).has_value());
    ASSERT_EQ(test::error_of(deposit(1, 100, 1000)),
              error_code::order_already_processed);
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(100));
    ASSERT_EQ(m_published.size(), 1UL);

    // Deposit and claim share one set of consumed ids.
    auto v = claim_voucher(1, m_user, native_asset, 10);
    auto res = m_vault->claim(call_context{m_user, {}, m_now},
                              v.m_sign_id,
                              m_user,
                              v.m_value,
                              test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::order_already_processed);
}

TEST_F(reserve_vault_test, wrong_signer_rejected) {
    m_transport->fund(native_asset, m_user, evmc::uint256be(100));
    auto v = deposit_voucher(1, native_asset, 100, 1000);
    auto res = m_vault->deposit(call_context{m_user, v.m_value, m_now},
                                v.m_sign_id,
                                m_deadline,
                                v.m_system_balance,
                                test::sign(v, test::make_key(test::key1)));
    ASSERT_EQ(test::error_of(res), error_code::wrong_signature);
    ASSERT_FALSE(m_vault->is_used(native_asset, v.m_sign_id));
    ASSERT_TRUE(evmc::is_zero(m_vault->balance(native_asset)));
    ASSERT_TRUE(m_published.empty());
}

TEST_F(reserve_vault_test, voucher_bound_to_contract) {
    m_transport->fund(native_asset, m_user, evmc::uint256be(100));
    auto v = deposit_voucher(1, native_asset, 100, 1000);
    v.m_contract = test::make_address(test::addr2);
    auto res = m_vault->deposit(call_context{m_user, v.m_value, m_now},
                                v.m_sign_id,
                                m_deadline,
                                v.m_system_balance,
                                test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::wrong_signature);

    // A voucher for a different sender is not usable either.
    auto other = deposit_voucher(1, native_asset, 100, 1000);
    other.m_account = m_admin;
    res = m_vault->deposit(call_context{m_user, other.m_value, m_now},
                           other.m_sign_id,
                           m_deadline,
                           other.m_system_balance,
                           test::sign(other, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::wrong_signature);
}

TEST_F(reserve_vault_test, deadline_is_inclusive) {
    m_now = m_deadline;
    ASSERT_FALSE(test::error_of(deposit(1, 10, 1000)).has_value());
    m_now = m_deadline + 1;
    ASSERT_EQ(test::error_of(deposit(2, 10, 1000)),
              error_code::deadline_expired);
}

TEST_F(reserve_vault_test, zero_value_deposit) {
    auto v = deposit_voucher(1, native_asset, 0, 1000);
    auto res = m_vault->deposit(call_context{m_user, {}, m_now},
                                v.m_sign_id,
                                m_deadline,
                                v.m_system_balance,
                                test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::zero_value);
}

TEST_F(reserve_vault_test, sweep_above_band) {
    // System balance 100: band is 110 to 120.
    auto res = deposit(1, 120, 100);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(test::events_of(res).size(), 1UL);
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(120));

    res = deposit(2, 1, 100);
    ASSERT_FALSE(test::error_of(res).has_value());
    auto events = test::events_of(res);
    ASSERT_EQ(events.size(), 2UL);
    auto sweep = std::get<auto_withdrawal>(events[1]);
    ASSERT_EQ(sweep.m_amount, evmc::uint256be(11));
    ASSERT_EQ(sweep.m_to, m_admin);
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(110));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_admin),
              evmc::uint256be(11));
}

TEST_F(reserve_vault_test, failed_sweep_returns_deposit) {
    ASSERT_FALSE(test::error_of(deposit(1, 120, 100)).has_value());
    m_published.clear();

    m_transport->m_rejected.insert(m_admin);
    ASSERT_EQ(test::error_of(deposit(2, 1, 100)), error_code::transfer_failed);
    ASSERT_FALSE(m_vault->is_used(native_asset, evmc::uint256be(2)));
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(120));
    ASSERT_EQ(m_transport->custody_balance(native_asset),
              m_vault->balance(native_asset));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_user),
              evmc::uint256be(1));
    ASSERT_EQ(m_vault->deposit_of(m_user, native_asset),
              evmc::uint256be(120));
    ASSERT_EQ(m_vault->last_sign_id(native_asset), evmc::uint256be(1));
    ASSERT_TRUE(m_published.empty());
}

TEST_F(reserve_vault_test, sign_ids_scoped_per_asset) {
    m_transport->fund(m_token, m_user, evmc::uint256be(50));
    auto v = deposit_voucher(5, m_token, 50, 1000);
    auto res = m_vault->deposit_token(call_context{m_user, {}, m_now},
                                      m_token,
                                      v.m_sign_id,
                                      v.m_value,
                                      m_deadline,
                                      v.m_system_balance,
                                      test::sign(v, m_signer_key));
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_TRUE(m_vault->is_used(m_token, evmc::uint256be(5)));
    ASSERT_FALSE(m_vault->is_used(native_asset, evmc::uint256be(5)));

    // The same id is still free for the native currency.
    ASSERT_FALSE(test::error_of(deposit(5, 10, 1000)).has_value());
    ASSERT_TRUE(m_vault->is_used(native_asset, evmc::uint256be(5)));

    // Claims consume ids in the same per-asset scope as deposits.
    auto c = claim_voucher(5, m_user, m_token, 10);
    res = m_vault->claim_token(call_context{m_user, {}, m_now},
                               c.m_sign_id,
                               m_user,
                               m_token,
                               c.m_value,
                               test::sign(c, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::order_already_processed);
    ASSERT_EQ(m_vault->balance(m_token), evmc::uint256be(50));
}

TEST_F(reserve_vault_test, absolute_minimum_raises_target) {
    auto params = reserve_parameters{};
    params.m_absolute_min = evmc::uint256be(30);
    auto res = m_vault->set_reserve_parameters(
        call_context{m_admin, {}, m_now},
        native_asset,
        params);
    ASSERT_FALSE(test::error_of(res).has_value());

    res = deposit(1, 50, 1);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(31));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_admin),
              evmc::uint256be(19));
}

TEST_F(reserve_vault_test, stale_sign_id_skips_sweep) {
    ASSERT_FALSE(test::error_of(deposit(5, 10, 1000)).has_value());
    auto res = deposit(3, 200, 100);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(test::events_of(res).size(), 1UL);
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(210));
    ASSERT_EQ(m_vault->last_sign_id(native_asset), evmc::uint256be(5));
}

TEST_F(reserve_vault_test, sweep_goes_to_withdraw_address) {
    auto treasury
        = test::make_address("0000000000000000000000000000000000007ea5");
    ASSERT_EQ(test::error_of(m_vault->set_withdraw_address(
                  call_context{m_admin, {}, m_now},
                  evmc::address{})),
              error_code::zero_address);
    ASSERT_EQ(test::error_of(m_vault->set_withdraw_address(
                  call_context{m_user, {}, m_now},
                  treasury)),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(test::error_of(m_vault->set_withdraw_address(
                                    call_context{m_admin, {}, m_now},
                                    treasury))
                     .has_value());
    ASSERT_EQ(m_vault->withdraw_address(), treasury);

    ASSERT_FALSE(test::error_of(deposit(1, 200, 100)).has_value());
    ASSERT_EQ(m_transport->balance_of(native_asset, treasury),
              evmc::uint256be(90));
}

TEST_F(reserve_vault_test, token_deposit_credits_received_amount) {
    m_transport->m_pull_fee = evmc::uint256be(5);
    m_transport->fund(m_token, m_user, evmc::uint256be(100));
    auto v = deposit_voucher(1, m_token, 100, 1000);
    auto res = m_vault->deposit_token(call_context{m_user, {}, m_now},
                                      m_token,
                                      v.m_sign_id,
                                      v.m_value,
                                      m_deadline,
                                      v.m_system_balance,
                                      test::sign(v, m_signer_key));
    ASSERT_FALSE(test::error_of(res).has_value());
    auto dep = std::get<deposited>(test::events_of(res)[0]);
    ASSERT_EQ(dep.m_value, evmc::uint256be(95));
    ASSERT_EQ(m_vault->balance(m_token), evmc::uint256be(95));
    ASSERT_EQ(m_vault->deposit_of(m_user, m_token), evmc::uint256be(95));
    ASSERT_EQ(m_vault->last_sign_id(m_token), evmc::uint256be(1));
    ASSERT_TRUE(evmc::is_zero(m_vault->last_sign_id(native_asset)));
}

TEST_F(reserve_vault_test, token_entry_points_reject_native) {
    auto v = deposit_voucher(1, native_asset, 10, 1000);
    auto res = m_vault->deposit_token(call_context{m_user, {}, m_now},
                                      native_asset,
                                      v.m_sign_id,
                                      v.m_value,
                                      m_deadline,
                                      v.m_system_balance,
                                      test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::zero_address);

    auto c = claim_voucher(2, m_user, native_asset, 10);
    res = m_vault->claim_token(call_context{m_user, {}, m_now},
                               c.m_sign_id,
                               m_user,
                               native_asset,
                               c.m_value,
                               test::sign(c, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::zero_address);
}

TEST_F(reserve_vault_test, claim_beyond_balance_rolls_back) {
    ASSERT_FALSE(test::error_of(deposit(1, 10, 1000)).has_value());
    auto v = claim_voucher(2, m_user, native_asset, 11);
    auto res = m_vault->claim(call_context{m_user, {}, m_now},
                              v.m_sign_id,
                              m_user,
                              v.m_value,
                              test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::insufficient_balance);
    ASSERT_FALSE(m_vault->is_used(native_asset, v.m_sign_id));
    ASSERT_EQ(m_vault->deposit_of(m_user, native_asset), evmc::uint256be(10));
    ASSERT_EQ(m_published.size(), 1UL);
}

TEST_F(reserve_vault_test, refund_bounded_by_deposit) {
    ASSERT_FALSE(test::error_of(deposit(1, 100, 1000)).has_value());
    auto ctx = call_context{m_admin, {}, m_now};
    ASSERT_EQ(test::error_of(m_vault->refund(ctx,
                                             m_user,
                                             native_asset,
                                             evmc::uint256be(10))),
              error_code::access_control_unauthorized_account);

    ASSERT_FALSE(
        test::error_of(m_vault->grant_role(ctx, refund_role(), m_admin))
            .has_value());
    ASSERT_EQ(test::error_of(m_vault->refund(ctx,
                                             m_user,
                                             native_asset,
                                             evmc::uint256be(101))),
              error_code::invalid_refund_amount);

    auto res = m_vault->refund(ctx, m_user, native_asset, evmc::uint256be(60));
    ASSERT_FALSE(test::error_of(res).has_value());
    auto ref = std::get<refunded>(test::events_of(res)[0]);
    ASSERT_EQ(ref.m_amount, evmc::uint256be(60));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_user),
              evmc::uint256be(60));
    ASSERT_TRUE(evmc::is_zero(m_vault->deposit_of(m_user, native_asset)));

    ASSERT_EQ(test::error_of(m_vault->refund(ctx,
                                             m_user,
                                             native_asset,
                                             evmc::uint256be(1))),
              error_code::invalid_refund_amount);
}

TEST_F(reserve_vault_test, withdraw_keeps_reserve) {
    ASSERT_FALSE(test::error_of(deposit(1, 100, 1000)).has_value());
    auto ctx = call_context{m_admin, {}, m_now};
    ASSERT_EQ(test::error_of(m_vault->withdraw(ctx,
                                               native_asset,
                                               evmc::uint256be(30))),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(
        test::error_of(m_vault->grant_role(ctx, withdraw_role(), m_admin))
            .has_value());
    ASSERT_EQ(test::error_of(m_vault->withdraw(ctx,
                                               native_asset,
                                               evmc::uint256be(101))),
              error_code::insufficient_balance);

    auto res = m_vault->withdraw(ctx, native_asset, evmc::uint256be(30));
    ASSERT_FALSE(test::error_of(res).has_value());
    auto w = std::get<withdrawn>(test::events_of(res)[0]);
    ASSERT_EQ(w.m_amount, evmc::uint256be(70));
    ASSERT_EQ(w.m_reserved, evmc::uint256be(30));
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(30));
}

TEST_F(reserve_vault_test, reserve_parameter_validation) {
    auto ctx = call_context{m_admin, {}, m_now};
    auto params = reserve_parameters{};

    params.m_min_coefficient = evmc::uint256be(9999);
    ASSERT_EQ(test::error_of(
                  m_vault->set_reserve_parameters(ctx, native_asset, params)),
              error_code::min_coefficient_too_low);

    params.m_min_coefficient = evmc::uint256be(10000);
    params.m_max_coefficient = evmc::uint256be(9999);
    ASSERT_EQ(test::error_of(
                  m_vault->set_reserve_parameters(ctx, native_asset, params)),
              error_code::max_coefficient_too_low);

    params.m_min_coefficient = evmc::uint256be(12000);
    params.m_max_coefficient = evmc::uint256be(11000);
    ASSERT_EQ(test::error_of(
                  m_vault->set_reserve_parameters(ctx, native_asset, params)),
              error_code::invalid_coefficient_order);

    params.m_min_coefficient = evmc::uint256be(10000);
    params.m_max_coefficient = evmc::uint256be(10000);
    ASSERT_EQ(test::error_of(m_vault->set_reserve_parameters(
                  call_context{m_user, {}, m_now},
                  native_asset,
                  params)),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(test::error_of(
                     m_vault->set_reserve_parameters(ctx, native_asset, params))
                     .has_value());
    ASSERT_EQ(m_vault->parameters(native_asset).m_max_coefficient,
              evmc::uint256be(10000));
    ASSERT_EQ(m_vault->parameters(m_token).m_max_coefficient,
              evmc::uint256be(default_max_coefficient));
}

TEST_F(reserve_vault_test, topup_and_reconcile) {
    m_transport->fund(native_asset, m_admin, evmc::uint256be(50));
    auto res = m_vault->topup(call_context{m_admin, evmc::uint256be(50), m_now});
    ASSERT_FALSE(test::error_of(res).has_value());
    auto t = std::get<topup>(test::events_of(res)[0]);
    ASSERT_EQ(t.m_account, m_admin);
    ASSERT_EQ(t.m_amount, evmc::uint256be(50));

    m_transport->airdrop(native_asset, evmc::uint256be(7));
    res = m_vault->reconcile(call_context{m_user, {}, m_now}, native_asset);
    ASSERT_FALSE(test::error_of(res).has_value());
    t = std::get<topup>(test::events_of(res)[0]);
    ASSERT_EQ(t.m_account, evmc::address{});
    ASSERT_EQ(t.m_amount, evmc::uint256be(7));
    ASSERT_EQ(m_vault->balance(native_asset), evmc::uint256be(57));

    res = m_vault->reconcile(call_context{m_user, {}, m_now}, native_asset);
    ASSERT_TRUE(test::events_of(res).empty());
}

TEST_F(reserve_vault_test, set_signer_replaces_signer) {
    auto ctx = call_context{m_admin, {}, m_now};
    ASSERT_EQ(test::error_of(m_vault->set_signer(ctx, evmc::address{})),
              error_code::zero_address);
    ASSERT_EQ(test::error_of(m_vault->set_signer(
                  call_context{m_user, {}, m_now},
                  m_user)),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(
        test::error_of(m_vault->set_signer(ctx, m_user)).has_value());
    ASSERT_FALSE(m_vault->has_role(signer_role(), m_signer));
    ASSERT_TRUE(m_vault->has_role(signer_role(), m_user));

    ASSERT_EQ(test::error_of(deposit(1, 10, 1000)),
              error_code::wrong_signature);
    m_signer_key = test::make_key(test::key1);
    ASSERT_FALSE(test::error_of(deposit(1, 10, 1000)).has_value());
}
