// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payment_bank.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

using namespace custody::ledger;

class payment_bank_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_cfg.m_contract_address
            = test::make_address("000000000000000000000000000000000000ba4c");
        m_bank = std::make_unique<payment_bank>(m_log,
                                                m_cfg,
                                                m_admin,
                                                m_signer,
                                                m_authority,
                                                m_transport);
        m_bank->set_event_sink([&](const event& e) {
            m_published.push_back(e);
        });
    }

    auto use_voucher(uint64_t sign_id,
                     const asset_id& asset,
                     uint64_t value,
                     uint64_t fee) -> voucher {
        auto v = voucher();
        v.m_layout = voucher_layout::bank_use;
        v.m_sign_id = evmc::uint256be(sign_id);
        v.m_value = evmc::uint256be(value);
        v.m_asset = asset;
        v.m_account = m_user;
        v.m_param = evmc::uint256be(7);
        v.m_fee = evmc::uint256be(fee);
        v.m_deadline = m_deadline;
        v.m_contract = m_cfg.m_contract_address;
        return v;
    }

    auto claim_voucher(voucher_layout layout,
                       uint64_t sign_id,
                       const asset_id& asset,
                       uint64_t value,
                       uint64_t fee) -> voucher {
        auto v = voucher();
        v.m_layout = layout;
        v.m_sign_id = evmc::uint256be(sign_id);
        v.m_account = m_user;
        v.m_asset = asset;
        v.m_value = evmc::uint256be(value);
        v.m_fee = evmc::uint256be(fee);
        v.m_deadline = m_deadline;
        v.m_contract = m_cfg.m_contract_address;
        return v;
    }

    /// Pays value plus fee in native currency from the user.
    auto use_eth(uint64_t sign_id,
                 uint64_t value,
                 uint64_t fee,
                 uint64_t attached) -> exec_return_type {
        m_transport->fund(native_asset, m_user, evmc::uint256be(attached));
        auto v = use_voucher(sign_id, native_asset, value, fee);
        return m_bank->use_eth(
            call_context{m_user, evmc::uint256be(attached), m_now},
            v.m_sign_id,
            v.m_value,
            v.m_param,
            v.m_fee,
            m_deadline,
            test::sign(v, m_signer_key));
    }

    /// Pays value in tokens plus the native fee from the user.
    auto use_token(uint64_t sign_id, uint64_t value, uint64_t fee)
        -> exec_return_type {
        m_transport->fund(m_token, m_user, evmc::uint256be(value));
        m_transport->fund(native_asset, m_user, evmc::uint256be(fee));
        auto v = use_voucher(sign_id, m_token, value, fee);
        return m_bank->use_token(
            call_context{m_user, evmc::uint256be(fee), m_now},
            m_token,
            v.m_sign_id,
            v.m_value,
            v.m_param,
            v.m_fee,
            m_deadline,
            test::sign(v, m_signer_key));
    }

    auto claim(uint64_t sign_id, const asset_id& asset, uint64_t value)
        -> exec_return_type {
        auto v = claim_voucher(voucher_layout::bank_claim,
                               sign_id,
                               asset,
                               value,
                               0);
        return m_bank->claim(call_context{m_user, {}, m_now},
                             asset,
                             v.m_sign_id,
                             v.m_value,
                             v.m_fee,
                             m_deadline,
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
    evmc::address m_operator{
        test::make_address("00000000000000000000000000000000000000cc")};
    asset_id m_token{
        test::make_address("00000000000000000000000000000000000070ce")};
    uint64_t m_now{1000};
    uint64_t m_deadline{2000};
    std::unique_ptr<payment_bank> m_bank;
    std::vector<event> m_published;
};

TEST_F(payment_bank_test, use_native) {
    auto res = use_eth(1, 100, 5, 105);
    ASSERT_FALSE(test::error_of(res).has_value());
    auto events = test::events_of(res);
    ASSERT_EQ(events.size(), 1UL);
    auto u = std::get<used>(events[0]);
    ASSERT_EQ(u.m_value, evmc::uint256be(100));
    ASSERT_EQ(u.m_account, m_user);
    ASSERT_EQ(u.m_param, evmc::uint256be(7));
    ASSERT_EQ(u.m_fee, evmc::uint256be(5));
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(105));
    ASSERT_TRUE(m_bank->is_used(evmc::uint256be(1)));

    ASSERT_EQ(test::error_of(use_eth(1, 100, 5, 105)),
              error_code::sign_id_already_used);
}

TEST_F(payment_bank_test, use_native_requires_value_and_fee) {
    ASSERT_EQ(test::error_of(use_eth(1, 100, 5, 104)),
              error_code::insufficient_fee);
    ASSERT_FALSE(m_bank->is_used(evmc::uint256be(1)));
    // Overpaying is rejected too; nothing is kept.
    ASSERT_EQ(test::error_of(use_eth(1, 100, 5, 106)),
              error_code::insufficient_fee);
    ASSERT_FALSE(m_bank->is_used(evmc::uint256be(1)));
    ASSERT_TRUE(evmc::is_zero(m_bank->balance(native_asset)));
    ASSERT_TRUE(evmc::is_zero(m_transport->custody_balance(native_asset)));
    ASSERT_EQ(test::error_of(use_eth(1, 0, 5, 5)), error_code::zero_value);
}

TEST_F(payment_bank_test, use_token_pulls_value_and_fee) {
    m_transport->fund(m_token, m_user, evmc::uint256be(100));
    m_transport->fund(native_asset, m_user, evmc::uint256be(3));
    auto v = use_voucher(1, m_token, 100, 3);
    auto sig = test::sign(v, m_signer_key);

    auto res = m_bank->use_token(call_context{m_user, evmc::uint256be(2), m_now},
                                 m_token,
                                 v.m_sign_id,
                                 v.m_value,
                                 v.m_param,
                                 v.m_fee,
                                 m_deadline,
                                 sig);
    ASSERT_EQ(test::error_of(res), error_code::insufficient_fee);
    res = m_bank->use_token(call_context{m_user, evmc::uint256be(4), m_now},
                            m_token,
                            v.m_sign_id,
                            v.m_value,
                            v.m_param,
                            v.m_fee,
                            m_deadline,
                            sig);
    ASSERT_EQ(test::error_of(res), error_code::insufficient_fee);

    res = m_bank->use_token(call_context{m_user, evmc::uint256be(3), m_now},
                            m_token,
                            v.m_sign_id,
                            v.m_value,
                            v.m_param,
                            v.m_fee,
                            m_deadline,
                            sig);
    ASSERT_FALSE(test::error_of(res).has_value());
    auto u = std::get<used>(test::events_of(res)[0]);
    ASSERT_EQ(u.m_asset, m_token);
    ASSERT_EQ(u.m_fee, evmc::uint256be(3));
    ASSERT_EQ(m_bank->balance(m_token), evmc::uint256be(100));
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(3));
    ASSERT_TRUE(evmc::is_zero(m_transport->balance_of(m_token, m_user)));
}

TEST_F(payment_bank_test, use_token_without_allowance_fails) {
    m_transport->fund(native_asset, m_user, evmc::uint256be(2));
    auto v = use_voucher(1, m_token, 100, 2);
    auto res = m_bank->use_token(call_context{m_user, evmc::uint256be(2), m_now},
                                 m_token,
                                 v.m_sign_id,
                                 v.m_value,
                                 v.m_param,
                                 v.m_fee,
                                 m_deadline,
                                 test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::transfer_failed);
    ASSERT_FALSE(m_bank->is_used(v.m_sign_id));

    // The fee pulled before the token transfer failed is returned.
    ASSERT_TRUE(evmc::is_zero(m_bank->balance(native_asset)));
    ASSERT_EQ(m_transport->custody_balance(native_asset),
              m_bank->balance(native_asset));
    ASSERT_EQ(m_transport->balance_of(native_asset, m_user),
              evmc::uint256be(2));
}

TEST_F(payment_bank_test, native_currency_only_through_use_eth) {
    m_transport->fund(native_asset, m_user, evmc::uint256be(100));
    auto v = use_voucher(1, native_asset, 100, 0);
    auto res = m_bank->use_token(
        call_context{m_user, evmc::uint256be(100), m_now},
        native_asset,
        v.m_sign_id,
        v.m_value,
        v.m_param,
        v.m_fee,
        m_deadline,
        test::sign(v, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::zero_address);
    ASSERT_FALSE(m_bank->is_used(v.m_sign_id));

    ASSERT_FALSE(test::error_of(use_eth(2, 100, 0, 100)).has_value());
    ASSERT_EQ(test::error_of(claim(3, native_asset, 10)),
              error_code::zero_address);
    ASSERT_FALSE(m_bank->is_used(evmc::uint256be(3)));
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(100));
}

TEST_F(payment_bank_test, claim_pays_sender) {
    ASSERT_FALSE(test::error_of(use_token(1, 100, 0)).has_value());
    auto res = claim(2, m_token, 60);
    ASSERT_FALSE(test::error_of(res).has_value());
    auto c = std::get<claimed>(test::events_of(res)[0]);
    ASSERT_EQ(c.m_account, m_user);
    ASSERT_EQ(c.m_asset, m_token);
    ASSERT_EQ(c.m_deadline, m_deadline);
    ASSERT_EQ(m_transport->balance_of(m_token, m_user), evmc::uint256be(60));
    ASSERT_EQ(m_bank->balance(m_token), evmc::uint256be(40));

    ASSERT_EQ(test::error_of(claim(2, m_token, 10)),
              error_code::sign_id_already_used);
    ASSERT_EQ(test::error_of(claim(3, m_token, 41)),
              error_code::insufficient_balance);
}

TEST_F(payment_bank_test, claim_expired) {
    ASSERT_FALSE(test::error_of(use_token(1, 100, 0)).has_value());
    m_now = m_deadline + 1;
    ASSERT_EQ(test::error_of(claim(2, m_token, 10)),
              error_code::deadline_expired);
}

TEST_F(payment_bank_test, fee_claim_layout) {
    ASSERT_FALSE(test::error_of(use_eth(1, 100, 0, 100)).has_value());
    auto v = claim_voucher(voucher_layout::fee_claim, 2, native_asset, 10, 1);
    auto sig = test::sign(v, m_signer_key);
    m_transport->fund(native_asset, m_user, evmc::uint256be(1));

    auto res = m_bank->fee_claim(call_context{m_user, {}, m_now},
                                 native_asset,
                                 v.m_sign_id,
                                 v.m_value,
                                 v.m_fee,
                                 m_deadline,
                                 sig);
    ASSERT_EQ(test::error_of(res), error_code::insufficient_fee);

    // A fee claim voucher does not authorize the tagged claim.
    auto t = claim_voucher(voucher_layout::fee_claim, 2, m_token, 10, 1);
    res = m_bank->claim(call_context{m_user, evmc::uint256be(1), m_now},
                        m_token,
                        t.m_sign_id,
                        t.m_value,
                        t.m_fee,
                        m_deadline,
                        test::sign(t, m_signer_key));
    ASSERT_EQ(test::error_of(res), error_code::wrong_signature);

    res = m_bank->fee_claim(call_context{m_user, evmc::uint256be(1), m_now},
                            native_asset,
                            v.m_sign_id,
                            v.m_value,
                            v.m_fee,
                            m_deadline,
                            test::sign(v, test::make_key(test::key2)));
    ASSERT_EQ(test::error_of(res), error_code::invalid_signature);

    res = m_bank->fee_claim(call_context{m_user, evmc::uint256be(1), m_now},
                            native_asset,
                            v.m_sign_id,
                            v.m_value,
                            v.m_fee,
                            m_deadline,
                            sig);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(91));
}

TEST_F(payment_bank_test, send_requires_operator_and_limit) {
    ASSERT_FALSE(test::error_of(use_eth(1, 100, 0, 100)).has_value());
    auto op = call_context{m_operator, {}, m_now};
    auto admin = call_context{m_admin, {}, m_now};
    auto to = test::make_address(test::addr0);

    ASSERT_EQ(test::error_of(
                  m_bank->send(op, native_asset, to, evmc::uint256be(10))),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(
        test::error_of(m_bank->grant_role(admin, operator_role(), m_operator))
            .has_value());
    ASSERT_EQ(test::error_of(
                  m_bank->send(op, native_asset, to, evmc::uint256be(10))),
              error_code::exceeds_token_limit);

    ASSERT_EQ(test::error_of(m_bank->set_send_limit(op,
                                                    native_asset,
                                                    evmc::uint256be(10))),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(test::error_of(m_bank->set_send_limit(admin,
                                                       native_asset,
                                                       evmc::uint256be(10)))
                     .has_value());
    ASSERT_EQ(m_bank->send_limit(native_asset), evmc::uint256be(10));
    ASSERT_EQ(test::error_of(
                  m_bank->send(op, native_asset, to, evmc::uint256be(11))),
              error_code::exceeds_token_limit);
    ASSERT_EQ(test::error_of(m_bank->send(op,
                                          native_asset,
                                          evmc::address{},
                                          evmc::uint256be(1))),
              error_code::zero_address);

    auto res = m_bank->send(op, native_asset, to, evmc::uint256be(10));
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_TRUE(std::holds_alternative<sent>(test::events_of(res)[0]));
    ASSERT_EQ(m_transport->balance_of(native_asset, to), evmc::uint256be(10));
}

TEST_F(payment_bank_test, send_batch_is_atomic) {
    ASSERT_FALSE(test::error_of(use_eth(1, 100, 0, 100)).has_value());
    auto admin = call_context{m_admin, {}, m_now};
    auto op = call_context{m_operator, {}, m_now};
    ASSERT_FALSE(
        test::error_of(m_bank->grant_role(admin, operator_role(), m_operator))
            .has_value());
    ASSERT_FALSE(test::error_of(m_bank->set_send_limit(admin,
                                                       native_asset,
                                                       evmc::uint256be(50)))
                     .has_value());
    auto a = test::make_address(test::addr0);
    auto b = test::make_address(test::addr2);

    ASSERT_EQ(test::error_of(m_bank->send_batch(
                  op,
                  native_asset,
                  {a, b},
                  {evmc::uint256be(1)})),
              error_code::arrays_length_mismatch);

    m_published.clear();
    ASSERT_EQ(test::error_of(m_bank->send_batch(
                  op,
                  native_asset,
                  {a, b},
                  {evmc::uint256be(10), evmc::uint256be(51)})),
              error_code::exceeds_token_limit);
    ASSERT_TRUE(evmc::is_zero(m_transport->balance_of(native_asset, a)));
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(100));
    ASSERT_TRUE(m_published.empty());

    // Funds already sent to earlier recipients are recovered when a later
    // transfer fails.
    m_transport->m_rejected.insert(b);
    ASSERT_EQ(test::error_of(m_bank->send_batch(
                  op,
                  native_asset,
                  {a, b},
                  {evmc::uint256be(10), evmc::uint256be(20)})),
              error_code::transfer_failed);
    ASSERT_TRUE(evmc::is_zero(m_transport->balance_of(native_asset, a)));
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(100));
    ASSERT_EQ(m_transport->custody_balance(native_asset),
              m_bank->balance(native_asset));
    ASSERT_TRUE(m_published.empty());
    m_transport->m_rejected.clear();

    auto res = m_bank->send_batch(op,
                                  native_asset,
                                  {a, b},
                                  {evmc::uint256be(10), evmc::uint256be(20)});
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(test::events_of(res).size(), 2UL);
    ASSERT_EQ(m_bank->balance(native_asset), evmc::uint256be(70));
}

TEST_F(payment_bank_test, withdraw_roles) {
    ASSERT_FALSE(test::error_of(use_eth(1, 100, 0, 100)).has_value());
    auto admin = call_context{m_admin, {}, m_now};
    auto to = test::make_address(test::addr0);
    ASSERT_FALSE(
        test::error_of(m_bank->grant_role(admin, operator_role(), m_operator))
            .has_value());

    // Operators cannot withdraw and withdrawers cannot send.
    ASSERT_EQ(test::error_of(m_bank->withdraw(
                  call_context{m_operator, {}, m_now},
                  native_asset,
                  to,
                  evmc::uint256be(1))),
              error_code::access_control_unauthorized_account);
    ASSERT_EQ(test::error_of(m_bank->withdraw(admin,
                                              native_asset,
                                              to,
                                              evmc::uint256be(1))),
              error_code::access_control_unauthorized_account);
    ASSERT_FALSE(
        test::error_of(m_bank->grant_role(admin, withdraw_role(), m_admin))
            .has_value());

    auto res = m_bank->withdraw(admin, native_asset, to, evmc::uint256be(30));
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(m_transport->balance_of(native_asset, to), evmc::uint256be(30));
    ASSERT_EQ(test::error_of(m_bank->send(admin,
                                          native_asset,
                                          to,
                                          evmc::uint256be(1))),
              error_code::access_control_unauthorized_account);

    res = m_bank->withdraw_all(admin, native_asset);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(m_transport->balance_of(native_asset, m_admin),
              evmc::uint256be(70));
    ASSERT_TRUE(evmc::is_zero(m_bank->balance(native_asset)));
    ASSERT_EQ(test::error_of(m_bank->withdraw_all(admin, native_asset)),
              error_code::zero_value);
}

TEST_F(payment_bank_test, role_administration) {
    auto admin = call_context{m_admin, {}, m_now};
    auto user = call_context{m_user, {}, m_now};
    ASSERT_EQ(test::error_of(m_bank->grant_role(user, operator_role(), m_user)),
              error_code::access_control_unauthorized_account);

    auto res = m_bank->grant_role(admin, operator_role(), m_user);
    ASSERT_EQ(test::events_of(res).size(), 1UL);
    ASSERT_TRUE(std::holds_alternative<role_granted>(test::events_of(res)[0]));
    // Granting a held role changes nothing.
    res = m_bank->grant_role(admin, operator_role(), m_user);
    ASSERT_TRUE(test::events_of(res).empty());
    ASSERT_FALSE(test::error_of(res).has_value());

    res = m_bank->revoke_role(admin, operator_role(), m_user);
    ASSERT_TRUE(std::holds_alternative<role_revoked>(test::events_of(res)[0]));
    ASSERT_FALSE(m_bank->has_role(operator_role(), m_user));

    ASSERT_FALSE(test::error_of(m_bank->revoke_role(admin, admin_role(), m_admin))
                     .has_value());
    ASSERT_EQ(test::error_of(m_bank->grant_role(admin, operator_role(), m_user)),
              error_code::access_control_unauthorized_account);
}

TEST_F(payment_bank_test, reentrant_claim_rejected) {
    ASSERT_FALSE(test::error_of(use_token(1, 100, 0)).has_value());
    auto inner = std::optional<exec_return_type>();
    m_transport->m_on_push = [&]() {
        m_transport->m_on_push = nullptr;
        inner = claim(2, m_token, 10);
    };
    auto res = claim(2, m_token, 10);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_TRUE(inner.has_value());
    ASSERT_EQ(test::error_of(inner.value()),
              error_code::sign_id_already_used);
    ASSERT_EQ(m_transport->balance_of(m_token, m_user), evmc::uint256be(10));
    ASSERT_EQ(m_bank->balance(m_token), evmc::uint256be(90));
    ASSERT_EQ(m_transport->custody_balance(m_token), m_bank->balance(m_token));
}

TEST_F(payment_bank_test, nested_events_follow_outer_result) {
    ASSERT_FALSE(test::error_of(use_token(1, 100, 0)).has_value());
    m_published.clear();

    // The nested operation succeeds but the outer one fails afterwards.
    m_transport->m_on_push = [&]() {
        m_transport->m_on_push = nullptr;
        auto nested = m_bank->grant_role(call_context{m_admin, {}, m_now},
                                         operator_role(),
                                         m_operator);
        ASSERT_FALSE(test::error_of(nested).has_value());
    };
    m_transport->m_fail_push = true;
    ASSERT_EQ(test::error_of(claim(2, m_token, 10)),
              error_code::transfer_failed);
    ASSERT_FALSE(m_bank->has_role(operator_role(), m_operator));
    ASSERT_FALSE(m_bank->is_used(evmc::uint256be(2)));
    ASSERT_TRUE(m_published.empty());
    ASSERT_EQ(m_bank->balance(m_token), evmc::uint256be(100));
    ASSERT_EQ(m_transport->custody_balance(m_token), m_bank->balance(m_token));

    // Events of a successful nested operation are published with the
    // outer operation's.
    m_transport->m_fail_push = false;
    m_transport->m_on_push = [&]() {
        m_transport->m_on_push = nullptr;
        auto nested = m_bank->grant_role(call_context{m_admin, {}, m_now},
                                         operator_role(),
                                         m_operator);
        ASSERT_FALSE(test::error_of(nested).has_value());
        ASSERT_TRUE(m_published.empty());
    };
    auto res = claim(3, m_token, 10);
    ASSERT_FALSE(test::error_of(res).has_value());
    ASSERT_EQ(test::events_of(res).size(), 2UL);
    ASSERT_EQ(m_published.size(), 2UL);
    ASSERT_TRUE(std::holds_alternative<claimed>(m_published[0]));
    ASSERT_TRUE(std::holds_alternative<role_granted>(m_published[1]));
    ASSERT_TRUE(m_bank->has_role(operator_role(), m_operator));
}

TEST_F(payment_bank_test, reconcile_credits_surplus) {
    ASSERT_FALSE(test::error_of(use_eth(1, 100, 0, 100)).has_value());
    m_transport->airdrop(m_token, evmc::uint256be(5));
    auto res = m_bank->reconcile(call_context{m_user, {}, m_now}, m_token);
    ASSERT_EQ(std::get<topup>(test::events_of(res)[0]).m_amount,
              evmc::uint256be(5));
    ASSERT_EQ(m_bank->balance(m_token), evmc::uint256be(5));
}
