#include <gtest/gtest.h>
#include <trustee/execution/engine.hpp>
#include <trustee/schema/query_error_code.hpp>
#include <trustee/testing/execution_fixture.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using trustee::schema::amount_t;
using trustee::schema::participant_id_t;
using trustee::schema::transaction_error_code;
using trustee::testing::code_of;
using trustee::testing::execution_fixture;
using trustee::testing::has_event;
using trustee::testing::make_participant;

const auto kP1 = make_participant(1);
const auto kP2 = make_participant(2);
const auto kP3 = make_participant(3);
const auto kP4 = make_participant(4);
const auto kDestination = make_participant(0xD0);
const auto kOutsider = make_participant(0xEE);

void expect_invariants(trustee::execution::engine& engine) {
  auto membership = engine.membership();
  ASSERT_TRUE(membership.has_value());
  EXPECT_GE(membership->participants.size(), 1u);
  EXPECT_GE(membership->threshold, 1u);
  EXPECT_LE(membership->threshold, membership->participants.size());
  for (const auto& proposal : engine.pending_proposals()) {
    EXPECT_EQ(proposal.approvals_count,
              engine.approval_records(proposal.proposal_id))
        << "proposal " << proposal.proposal_id;
  }
}

trustee::schema::bytes_t encode_key(auto value) {
  auto encoder = trustee::testing::scale_encoder_t{};
  return encoder.encode(value);
}

template <typename T>
T decode_value(const trustee::schema::query_result_t& result) {
  auto encoder = trustee::testing::scale_encoder_t{};
  return encoder.decode<T>(trustee::schema::bytes_view_t{result.value.data(),
                                                         result.value.size()});
}

}  // namespace

TEST(engine_integration, transfer_flow_executes_exactly_once) {
  auto fixture = execution_fixture{"trustee_engine_transfer"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  auto deliveries = std::vector<std::pair<participant_id_t, amount_t>>{};
  engine.set_transfer_handler(
      [&](const participant_id_t& destination, const amount_t& amount) {
        deliveries.emplace_back(destination, amount);
        return true;
      });
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{10}).code, 0u);

  auto proposed = engine.propose_transfer(kP1, kDestination, amount_t{5});
  ASSERT_EQ(proposed.code, 0u) << proposed.log;
  EXPECT_TRUE(has_event(proposed, "proposal_created"));
  EXPECT_TRUE(has_event(proposed, "approval_granted"));
  auto proposal = engine.proposal(0);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->status, trustee::schema::proposal_status_t::pending);
  EXPECT_EQ(proposal->approvals_count, 1u);
  EXPECT_EQ(proposal->proposer, kP1);

  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  EXPECT_EQ(engine.proposal(0)->approvals_count, 2u);
  EXPECT_EQ(engine.proposal(0)->status,
            trustee::schema::proposal_status_t::pending);

  auto executed = engine.execute(kP3, 0);
  ASSERT_EQ(executed.code, 0u) << executed.log;
  EXPECT_TRUE(has_event(executed, "transfer_sent"));
  EXPECT_TRUE(has_event(executed, "proposal_executed"));
  EXPECT_EQ(engine.balance(), amount_t{5});
  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries[0].first, kDestination);
  EXPECT_EQ(deliveries[0].second, amount_t{5});
  EXPECT_EQ(engine.proposal(0)->status,
            trustee::schema::proposal_status_t::executed);

  auto repeat = engine.execute(kP1, 0);
  EXPECT_EQ(repeat.code, code_of(transaction_error_code::proposal_not_pending));
  EXPECT_EQ(repeat.codespace, "trustee.execute");
  EXPECT_EQ(engine.approve(kP3, 0).code,
            code_of(transaction_error_code::proposal_not_pending));
  EXPECT_EQ(engine.revoke(kP1, 0).code,
            code_of(transaction_error_code::proposal_not_pending));
  EXPECT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(engine.balance(), amount_t{5});
}

TEST(engine_integration, remove_participant_succeeds_within_bounds) {
  auto fixture = execution_fixture{"trustee_engine_remove"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  ASSERT_EQ(engine.propose_remove_participant(kP1, kP3).code, 0u);
  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  auto executed = engine.execute(kP1, 0);
  ASSERT_EQ(executed.code, 0u) << executed.log;
  EXPECT_TRUE(has_event(executed, "participant_removed"));

  auto membership = engine.membership();
  ASSERT_TRUE(membership.has_value());
  EXPECT_EQ(membership->participants, (std::vector{kP1, kP2}));
  EXPECT_EQ(membership->threshold, 2u);
  expect_invariants(engine);
}

TEST(engine_integration, remove_proposal_rejected_when_threshold_equals_count) {
  auto fixture = execution_fixture{"trustee_engine_remove_floor"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 3);

  auto proposed = engine.propose_remove_participant(kP1, kP3);
  EXPECT_EQ(proposed.code,
            code_of(transaction_error_code::membership_floor_violated));
  EXPECT_EQ(engine.proposal_count(), 0u);
}

TEST(engine_integration, outsider_deposit_increases_balance) {
  auto fixture = execution_fixture{"trustee_engine_deposit"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  auto deposited = engine.deposit(kOutsider, amount_t{10});
  ASSERT_EQ(deposited.code, 0u);
  ASSERT_EQ(deposited.events.size(), 1u);
  EXPECT_EQ(deposited.events[0].type, "deposit_received");
  EXPECT_EQ(engine.balance(), amount_t{10});
  EXPECT_TRUE(engine.pending_proposals().empty());
}

TEST(engine_integration, deposit_is_accepted_before_initialization) {
  auto fixture = execution_fixture{"trustee_engine_early_deposit"};
  auto& engine = fixture.engine();

  EXPECT_EQ(engine.deposit(kOutsider, amount_t{3}).code, 0u);
  EXPECT_EQ(engine.balance(), amount_t{3});
  EXPECT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{1}).code,
            code_of(transaction_error_code::wallet_not_initialized));
}

TEST(engine_integration, deposit_overflow_is_rejected) {
  auto fixture = execution_fixture{"trustee_engine_overflow"};
  auto& engine = fixture.engine();
  auto max = std::numeric_limits<amount_t>::max();

  ASSERT_EQ(engine.deposit(kOutsider, max).code, 0u);
  EXPECT_EQ(engine.deposit(kOutsider, amount_t{1}).code,
            code_of(transaction_error_code::invalid_amount));
  EXPECT_EQ(engine.balance(), max);
}

TEST(engine_integration, governance_changes_revalidate_at_execution) {
  auto fixture = execution_fixture{"trustee_engine_revalidate"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  ASSERT_EQ(engine.propose_change_threshold(kP1, 1).code, 0u);
  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  ASSERT_EQ(engine.propose_remove_participant(kP1, kP2).code, 0u);

  auto threshold = engine.execute(kP1, 0);
  ASSERT_EQ(threshold.code, 0u) << threshold.log;
  EXPECT_TRUE(has_event(threshold, "threshold_changed"));
  EXPECT_EQ(engine.membership()->threshold, 1u);

  auto removed = engine.execute(kP1, 1);
  ASSERT_EQ(removed.code, 0u) << removed.log;
  EXPECT_EQ(engine.membership()->participants, (std::vector{kP1, kP3}));
  EXPECT_EQ(engine.membership()->threshold, 1u);
  expect_invariants(engine);
}

TEST(engine_integration, stale_removal_fails_and_stays_pending) {
  auto fixture = execution_fixture{"trustee_engine_stale_remove"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  ASSERT_EQ(engine.propose_remove_participant(kP1, kP3).code, 0u);
  ASSERT_EQ(engine.propose_remove_participant(kP1, kP2).code, 0u);
  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  ASSERT_EQ(engine.approve(kP2, 1).code, 0u);
  ASSERT_EQ(engine.execute(kP1, 0).code, 0u);

  auto stale = engine.execute(kP1, 1);
  EXPECT_EQ(stale.code,
            code_of(transaction_error_code::membership_floor_violated));
  EXPECT_EQ(engine.proposal(1)->status,
            trustee::schema::proposal_status_t::pending);
  EXPECT_EQ(engine.membership()->participants, (std::vector{kP1, kP2}));
  expect_invariants(engine);
}

TEST(engine_integration, stale_threshold_change_fails_at_execution) {
  auto fixture = execution_fixture{"trustee_engine_stale_threshold"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 1);

  ASSERT_EQ(engine.propose_change_threshold(kP1, 3).code, 0u);
  ASSERT_EQ(engine.propose_remove_participant(kP1, kP3).code, 0u);
  ASSERT_EQ(engine.execute(kP1, 1).code, 0u);

  EXPECT_EQ(engine.execute(kP1, 0).code,
            code_of(transaction_error_code::invalid_threshold));
  EXPECT_EQ(engine.membership()->threshold, 1u);
}

TEST(engine_integration, add_participant_checks_duplicates_twice) {
  auto fixture = execution_fixture{"trustee_engine_add"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2}, 1);

  EXPECT_EQ(engine.propose_add_participant(kP1, kP2).code,
            code_of(transaction_error_code::duplicate_participant));
  EXPECT_EQ(
      engine.propose_add_participant(kP1, trustee::schema::make_zero_hash())
          .code,
      code_of(transaction_error_code::invalid_participant));

  ASSERT_EQ(engine.propose_add_participant(kP1, kP4).code, 0u);
  ASSERT_EQ(engine.propose_add_participant(kP2, kP4).code, 0u);
  auto added = engine.execute(kP2, 0);
  ASSERT_EQ(added.code, 0u) << added.log;
  EXPECT_TRUE(has_event(added, "participant_added"));
  EXPECT_EQ(engine.membership()->participants.size(), 3u);

  EXPECT_EQ(engine.execute(kP4, 1).code,
            code_of(transaction_error_code::duplicate_participant));
  EXPECT_EQ(engine.proposal(1)->status,
            trustee::schema::proposal_status_t::pending);
}

TEST(engine_integration, proposal_validation_rejects_bad_actions) {
  auto fixture = execution_fixture{"trustee_engine_validation"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);

  EXPECT_EQ(engine.propose_transfer(kOutsider, kDestination, amount_t{1}).code,
            code_of(transaction_error_code::authorization_denied));
  EXPECT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{0}).code,
            code_of(transaction_error_code::invalid_amount));
  EXPECT_EQ(engine
                .propose_transfer(kP1, trustee::schema::make_zero_hash(),
                                  amount_t{1})
                .code,
            code_of(transaction_error_code::invalid_participant));
  EXPECT_EQ(engine.propose_remove_participant(kP1, kP4).code,
            code_of(transaction_error_code::participant_missing));
  EXPECT_EQ(engine.propose_change_threshold(kP1, 0).code,
            code_of(transaction_error_code::invalid_threshold));
  EXPECT_EQ(engine.propose_change_threshold(kP1, 4).code,
            code_of(transaction_error_code::invalid_threshold));
  EXPECT_EQ(engine.proposal_count(), 0u);
  EXPECT_TRUE(trustee::testing::query_events(engine, 0, 100).size() == 1u);
}

TEST(engine_integration, approval_properties_hold) {
  auto fixture = execution_fixture{"trustee_engine_approvals"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 3);
  ASSERT_EQ(engine.propose_change_threshold(kP1, 2).code, 0u);

  EXPECT_EQ(engine.approve(kP1, 0).code,
            code_of(transaction_error_code::duplicate_approval));
  EXPECT_EQ(engine.approve(kOutsider, 0).code,
            code_of(transaction_error_code::authorization_denied));
  EXPECT_EQ(engine.approve(kP2, 9).code,
            code_of(transaction_error_code::proposal_missing));
  EXPECT_EQ(engine.revoke(kP2, 0).code,
            code_of(transaction_error_code::approval_missing));

  auto before = engine.proposal(0).value();
  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  EXPECT_EQ(engine.approve(kP2, 0).code,
            code_of(transaction_error_code::duplicate_approval));
  auto revoked = engine.revoke(kP2, 0);
  ASSERT_EQ(revoked.code, 0u);
  EXPECT_TRUE(has_event(revoked, "approval_revoked"));

  auto after = engine.proposal(0).value();
  EXPECT_EQ(after.approvals_count, before.approvals_count);
  EXPECT_FALSE(engine.has_approved(0, kP2));
  EXPECT_TRUE(engine.has_approved(0, kP1));
  expect_invariants(engine);

  EXPECT_EQ(engine.execute(kP1, 0).code,
            code_of(transaction_error_code::insufficient_approvals));
  ASSERT_EQ(engine.approve(kP2, 0).code, 0u);
  ASSERT_EQ(engine.approve(kP3, 0).code, 0u);
  EXPECT_EQ(engine.execute(kOutsider, 0).code,
            code_of(transaction_error_code::authorization_denied));
  EXPECT_EQ(engine.execute(kP3, 0).code, 0u);
}

TEST(engine_integration, removal_sweeps_votes_on_every_pending_proposal) {
  auto fixture = execution_fixture{"trustee_engine_sweep"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3, kP4}, 2);
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{100}).code, 0u);

  ASSERT_EQ(engine.propose_transfer(kP3, kDestination, amount_t{1}).code, 0u);
  ASSERT_EQ(engine.propose_change_threshold(kP1, 3).code, 0u);
  ASSERT_EQ(engine.approve(kP3, 1).code, 0u);
  ASSERT_EQ(engine.propose_add_participant(kP2, make_participant(5)).code,
            0u);
  ASSERT_EQ(engine.propose_remove_participant(kP1, kP3).code, 0u);
  ASSERT_EQ(engine.approve(kP2, 3).code, 0u);

  auto removed = engine.execute(kP1, 3);
  ASSERT_EQ(removed.code, 0u) << removed.log;
  auto swept = 0;
  for (const auto& event : removed.events) {
    if (event.type == "approval_swept") {
      ++swept;
    }
  }
  EXPECT_EQ(swept, 2);

  EXPECT_EQ(engine.proposal(0)->approvals_count, 0u);
  EXPECT_EQ(engine.proposal(1)->approvals_count, 1u);
  EXPECT_EQ(engine.proposal(2)->approvals_count, 1u);
  EXPECT_FALSE(engine.has_approved(0, kP3));
  EXPECT_FALSE(engine.has_approved(1, kP3));
  EXPECT_TRUE(engine.has_approved(1, kP1));
  expect_invariants(engine);

  EXPECT_EQ(engine.execute(kP1, 0).code,
            code_of(transaction_error_code::insufficient_approvals));
  EXPECT_EQ(engine.approve(kP3, 2).code,
            code_of(transaction_error_code::authorization_denied));
}

TEST(engine_integration, failed_transfers_roll_back_every_effect) {
  auto fixture = execution_fixture{"trustee_engine_transfer_failure"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2}, 1);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{5}).code, 0u);

  EXPECT_EQ(engine.execute(kP1, 0).code,
            code_of(transaction_error_code::insufficient_balance));
  EXPECT_EQ(engine.proposal(0)->status,
            trustee::schema::proposal_status_t::pending);

  ASSERT_EQ(engine.deposit(kOutsider, amount_t{8}).code, 0u);
  auto events_before = trustee::testing::query_events(engine, 0, 1000).size();

  engine.set_transfer_handler(
      [](const participant_id_t&, const amount_t&) { return false; });
  auto rejected = engine.execute(kP1, 0);
  EXPECT_EQ(rejected.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_TRUE(rejected.events.empty());
  EXPECT_EQ(engine.balance(), amount_t{8});
  EXPECT_EQ(engine.proposal(0)->status,
            trustee::schema::proposal_status_t::pending);
  EXPECT_TRUE(engine.has_approved(0, kP1));

  engine.set_transfer_handler([](const participant_id_t&, const amount_t&) {
    throw std::runtime_error{"bridge offline"};
    return true;
  });
  auto thrown = engine.execute(kP1, 0);
  EXPECT_EQ(thrown.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(thrown.info, "bridge offline");
  EXPECT_EQ(engine.balance(), amount_t{8});
  EXPECT_EQ(trustee::testing::query_events(engine, 0, 1000).size(),
            events_before);

  engine.set_transfer_handler({});
  EXPECT_EQ(engine.execute(kP1, 0).code, 0u);
  EXPECT_EQ(engine.balance(), amount_t{3});
}

TEST(engine_integration, reentrant_calls_observe_executed_state) {
  auto fixture = execution_fixture{"trustee_engine_reentrancy"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2}, 1);
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{10}).code, 0u);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{4}).code, 0u);

  auto calls = 0;
  auto nested_codes = std::vector<uint32_t>{};
  engine.set_transfer_handler(
      [&](const participant_id_t&, const amount_t&) {
        ++calls;
        nested_codes.push_back(engine.execute(kP2, 0).code);
        nested_codes.push_back(engine.approve(kP2, 0).code);
        nested_codes.push_back(engine.revoke(kP1, 0).code);
        return true;
      });

  ASSERT_EQ(engine.execute(kP1, 0).code, 0u);
  EXPECT_EQ(calls, 1);
  ASSERT_EQ(nested_codes.size(), 3u);
  for (const auto code : nested_codes) {
    EXPECT_EQ(code, code_of(transaction_error_code::proposal_not_pending));
  }
  EXPECT_EQ(engine.balance(), amount_t{6});
}

TEST(engine_integration, nested_effects_roll_back_with_failing_outer_call) {
  auto fixture = execution_fixture{"trustee_engine_nested_rollback"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2}, 1);
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{10}).code, 0u);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{4}).code, 0u);

  auto nested_deposit = uint32_t{99};
  engine.set_transfer_handler(
      [&](const participant_id_t& destination, const amount_t&) {
        nested_deposit = engine.deposit(destination, amount_t{50}).code;
        return false;
      });

  EXPECT_EQ(engine.execute(kP1, 0).code,
            code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(nested_deposit, 0u);
  EXPECT_EQ(engine.balance(), amount_t{10});
}

TEST(engine_integration, initialize_is_accepted_once) {
  auto fixture = execution_fixture{"trustee_engine_initialize"};
  auto& engine = fixture.engine();

  EXPECT_EQ(engine.initialize({kP1, kP1}, 1).code,
            code_of(transaction_error_code::duplicate_participant));
  EXPECT_FALSE(engine.membership().has_value());

  auto initialized = engine.initialize({kP2, kP1}, 2);
  ASSERT_EQ(initialized.code, 0u);
  EXPECT_TRUE(has_event(initialized, "wallet_initialized"));
  EXPECT_EQ(engine.initialize({kP3}, 1).code,
            code_of(transaction_error_code::wallet_already_initialized));
  EXPECT_EQ(engine.membership()->participants, (std::vector{kP1, kP2}));
}

TEST(engine_integration, finalize_block_applies_transactions_in_order) {
  auto fixture = execution_fixture{"trustee_engine_block"};
  auto& engine = fixture.engine();
  auto chain_id = execution_fixture::chain_id();
  using trustee::testing::encode_transaction;
  using trustee::testing::make_transaction;

  auto txs = std::vector<trustee::schema::bytes_t>{
      encode_transaction(make_transaction(
          chain_id, 0, kP1,
          trustee::schema::initialize_wallet_t{.participants = {kP1, kP2},
                                               .threshold = 1})),
      encode_transaction(make_transaction(
          chain_id, 0, kOutsider,
          trustee::schema::deposit_t{.amount = amount_t{20}})),
      encode_transaction(make_transaction(
          chain_id, 1, kP1,
          trustee::schema::propose_action_t{
              .action = trustee::schema::transfer_action_t{
                  .destination = kDestination, .amount = amount_t{7}}})),
      encode_transaction(make_transaction(
          chain_id, 1, kP1,
          trustee::schema::execute_proposal_t{.proposal_id = 0})),
      encode_transaction(make_transaction(
          trustee::testing::make_hash(0x01), 2, kP1,
          trustee::schema::execute_proposal_t{.proposal_id = 0})),
      trustee::schema::bytes_t{0xFF, 0x00},
      encode_transaction(make_transaction(
          chain_id, 2, kP1,
          trustee::schema::execute_proposal_t{.proposal_id = 0})),
  };

  auto block = engine.finalize_block(1, txs);
  ASSERT_EQ(block.tx_results.size(), txs.size());
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_EQ(block.tx_results[2].code, 0u);
  EXPECT_EQ(block.tx_results[3].code,
            code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(block.tx_results[4].code,
            code_of(transaction_error_code::invalid_chain_id));
  EXPECT_EQ(block.tx_results[5].code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.tx_results[6].code, 0u);
  EXPECT_NE(block.state_root, trustee::schema::make_zero_hash());
  EXPECT_EQ(engine.next_nonce(kP1), 3u);
  EXPECT_EQ(engine.next_nonce(kOutsider), 1u);

  auto committed = engine.commit();
  EXPECT_EQ(committed.committed_height, 1);
  EXPECT_EQ(committed.state_root, block.state_root);
  EXPECT_EQ(engine.info().last_block_height, 1);
  EXPECT_EQ(engine.balance(), amount_t{13});

  auto history = engine.history(1, 1);
  ASSERT_EQ(history.size(), txs.size());
  for (std::size_t i = 0; i < history.size(); ++i) {
    EXPECT_EQ(history[i].index, i);
    EXPECT_EQ(history[i].code, block.tx_results[i].code);
    EXPECT_EQ(history[i].tx, txs[i]);
  }
  EXPECT_TRUE(engine.history(2, 5).empty());

  auto replica = execution_fixture{"trustee_engine_block_replica"};
  auto replayed = replica.engine().finalize_block(1, txs);
  EXPECT_EQ(replayed.state_root, block.state_root);
}

TEST(engine_integration, committed_state_survives_engine_restart) {
  auto fixture = execution_fixture{"trustee_engine_restart"};
  auto& engine = fixture.engine();
  auto chain_id = execution_fixture::chain_id();
  auto result = trustee::testing::finalize_single(
      engine, 1,
      trustee::testing::make_transaction(
          chain_id, 0, kP1,
          trustee::schema::initialize_wallet_t{.participants = {kP1, kP2},
                                               .threshold = 2}));
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{9}).code, 0u);

  auto reopened = trustee::execution::engine{fixture.encoder(),
                                             fixture.storage(), chain_id};
  EXPECT_EQ(reopened.info().last_block_height, 1);
  EXPECT_EQ(reopened.info().last_block_state_root,
            engine.info().last_block_state_root);
  ASSERT_TRUE(reopened.membership().has_value());
  EXPECT_EQ(reopened.membership()->threshold, 2u);
  EXPECT_EQ(reopened.next_nonce(kP1), 1u);
  EXPECT_EQ(reopened.balance(), amount_t{0});
}

TEST(engine_integration, check_transaction_validates_envelope_only) {
  auto fixture = execution_fixture{"trustee_engine_checktx"};
  auto& engine = fixture.engine();
  auto tx = trustee::testing::make_transaction(
      execution_fixture::chain_id(), 5, kP1,
      trustee::schema::approve_proposal_t{.proposal_id = 0});

  auto encoded = trustee::testing::encode_transaction(tx);
  EXPECT_EQ(engine.check_transaction(trustee::schema::make_bytes_view(encoded))
                .code,
            0u);

  tx.version = 2;
  encoded = trustee::testing::encode_transaction(tx);
  auto wrong_version =
      engine.check_transaction(trustee::schema::make_bytes_view(encoded));
  EXPECT_EQ(wrong_version.code,
            code_of(transaction_error_code::unsupported_transaction_version));
  EXPECT_EQ(wrong_version.codespace, "trustee.checktx");

  tx.version = 1;
  tx.chain_id = trustee::testing::make_hash(0x02);
  encoded = trustee::testing::encode_transaction(tx);
  EXPECT_EQ(engine.check_transaction(trustee::schema::make_bytes_view(encoded))
                .code,
            code_of(transaction_error_code::invalid_chain_id));

  auto garbage = trustee::schema::bytes_t{0x01};
  EXPECT_EQ(engine.check_transaction(trustee::schema::make_bytes_view(garbage))
                .code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(engine.next_nonce(kP1), 0u);
}

TEST(engine_integration, queries_expose_wallet_state) {
  auto fixture = execution_fixture{"trustee_engine_query"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2, kP3}, 2);
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{42}).code, 0u);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{2}).code, 0u);
  ASSERT_EQ(engine.propose_change_threshold(kP2, 3).code, 0u);
  (void)engine.commit();

  auto info = engine.query("/engine/info", {});
  ASSERT_EQ(info.code, 0u);
  auto [height, root, chain_id] = decode_value<
      std::tuple<int64_t, trustee::schema::hash32_t, trustee::schema::hash32_t>>(
      info);
  EXPECT_EQ(height, 0);
  EXPECT_EQ(root, trustee::schema::make_zero_hash());
  EXPECT_EQ(chain_id, execution_fixture::chain_id());

  auto membership = engine.query("/wallet/membership", {});
  ASSERT_EQ(membership.code, 0u);
  EXPECT_EQ(decode_value<trustee::schema::membership_state_t>(membership)
                .participants.size(),
            3u);

  auto balance = engine.query("/wallet/balance", {});
  ASSERT_EQ(balance.code, 0u);
  EXPECT_EQ(decode_value<amount_t>(balance), amount_t{42});

  auto proposal_key = encode_key(uint64_t{1});
  auto proposal = engine.query(
      "/proposal", trustee::schema::make_bytes_view(proposal_key));
  ASSERT_EQ(proposal.code, 0u);
  EXPECT_EQ(proposal.key, proposal_key);
  EXPECT_EQ(decode_value<trustee::schema::proposal_state_t>(proposal).proposer,
            kP2);

  auto approval_key = encode_key(std::tuple{uint64_t{0}, kP1});
  auto approval = engine.query(
      "/approval", trustee::schema::make_bytes_view(approval_key));
  ASSERT_EQ(approval.code, 0u);
  EXPECT_TRUE(decode_value<bool>(approval));

  auto pending = engine.query("/proposals/pending", {});
  ASSERT_EQ(pending.code, 0u);
  EXPECT_EQ(
      decode_value<std::vector<trustee::schema::proposal_state_t>>(pending)
          .size(),
      2u);

  auto events = trustee::testing::query_events(engine, 0, 100);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().event.type, "wallet_initialized");
  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].event_id, i);
  }

  auto missing_key = encode_key(uint64_t{77});
  EXPECT_EQ(engine
                .query("/proposal",
                       trustee::schema::make_bytes_view(missing_key))
                .code,
            static_cast<uint32_t>(trustee::schema::query_error_code::not_found));
  auto short_key = trustee::schema::bytes_t{0x01};
  EXPECT_EQ(
      engine.query("/proposal", trustee::schema::make_bytes_view(short_key))
          .code,
      static_cast<uint32_t>(trustee::schema::query_error_code::invalid_key));
  auto unsupported = engine.query("/wallet/unknown", {});
  EXPECT_EQ(unsupported.code,
            static_cast<uint32_t>(
                trustee::schema::query_error_code::unsupported_path));
  EXPECT_EQ(unsupported.codespace, "trustee.query");
}

TEST(engine_integration, handler_may_replace_itself_while_running) {
  auto fixture = execution_fixture{"trustee_engine_handler_swap"};
  auto& engine = fixture.engine();
  fixture.bootstrap({kP1, kP2}, 1);
  ASSERT_EQ(engine.deposit(kOutsider, amount_t{10}).code, 0u);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{2}).code, 0u);
  ASSERT_EQ(engine.propose_transfer(kP1, kDestination, amount_t{3}).code, 0u);

  auto first_calls = 0;
  auto second_calls = 0;
  engine.set_transfer_handler([&](const participant_id_t&, const amount_t&) {
    ++first_calls;
    engine.set_transfer_handler(
        [&](const participant_id_t&, const amount_t&) {
          ++second_calls;
          return true;
        });
    return true;
  });

  ASSERT_EQ(engine.execute(kP1, 0).code, 0u);
  ASSERT_EQ(engine.execute(kP1, 1).code, 0u);
  EXPECT_EQ(first_calls, 1);
  EXPECT_EQ(second_calls, 1);
  EXPECT_EQ(engine.balance(), amount_t{5});
}

TEST(engine_integration, non_standard_handler_throw_fails_the_transfer) {
  auto fixture = execution_fixture{"trustee_engine_handler_throw"};
  auto& engine = fixture.engine();
  auto chain_id = execution_fixture::chain_id();
  using trustee::testing::encode_transaction;
  using trustee::testing::make_transaction;

  engine.set_transfer_handler(
      [](const participant_id_t&, const amount_t&) -> bool { throw 42; });

  auto txs = std::vector<trustee::schema::bytes_t>{
      encode_transaction(make_transaction(
          chain_id, 0, kP1,
          trustee::schema::initialize_wallet_t{.participants = {kP1},
                                               .threshold = 1})),
      encode_transaction(make_transaction(
          chain_id, 0, kOutsider,
          trustee::schema::deposit_t{.amount = amount_t{9}})),
      encode_transaction(make_transaction(
          chain_id, 1, kP1,
          trustee::schema::propose_action_t{
              .action = trustee::schema::transfer_action_t{
                  .destination = kDestination, .amount = amount_t{4}}})),
      encode_transaction(make_transaction(
          chain_id, 2, kP1,
          trustee::schema::execute_proposal_t{.proposal_id = 0})),
  };

  auto block = engine.finalize_block(1, txs);
  ASSERT_EQ(block.tx_results.size(), txs.size());
  EXPECT_EQ(block.tx_results[2].code, 0u);
  EXPECT_EQ(block.tx_results[3].code,
            code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(block.tx_results[3].info, "non-standard exception");
  EXPECT_EQ(engine.next_nonce(kP1), 2u);

  (void)engine.commit();
  EXPECT_EQ(engine.balance(), amount_t{9});
  EXPECT_EQ(engine.proposal(0)->status,
            trustee::schema::proposal_status_t::pending);
  EXPECT_EQ(engine.history(1, 1).size(), txs.size());
}

TEST(engine_integration, query_height_tracks_the_state_it_reads) {
  auto fixture = execution_fixture{"trustee_engine_query_height"};
  auto& engine = fixture.engine();
  auto block = engine.finalize_block(
      1, {trustee::testing::encode_transaction(
             trustee::testing::make_transaction(
                 execution_fixture::chain_id(), 0, kOutsider,
                 trustee::schema::deposit_t{.amount = amount_t{6}}))});
  ASSERT_EQ(block.tx_results.front().code, 0u);

  auto pending = engine.query("/wallet/balance", {});
  ASSERT_EQ(pending.code, 0u);
  EXPECT_EQ(decode_value<amount_t>(pending), amount_t{6});
  EXPECT_EQ(pending.height, 1);
  EXPECT_EQ(engine.info().last_block_height, 0);

  (void)engine.commit();
  EXPECT_EQ(engine.query("/wallet/balance", {}).height, 1);

  ASSERT_EQ(engine.deposit(kOutsider, amount_t{1}).code, 0u);
  auto buffered = engine.query("/wallet/balance", {});
  EXPECT_EQ(decode_value<amount_t>(buffered), amount_t{7});
  EXPECT_EQ(buffered.height, 1);
}
