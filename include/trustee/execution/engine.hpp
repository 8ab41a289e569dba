#pragma once

#include <trustee/execution/approval_ledger.hpp>
#include <trustee/execution/failure.hpp>
#include <trustee/execution/membership_registry.hpp>
#include <trustee/execution/proposal_store.hpp>
#include <trustee/execution/state_buffer.hpp>
#include <trustee/execution/transfer_handler.hpp>
#include <trustee/schema/app_info.hpp>
#include <trustee/schema/block_result.hpp>
#include <trustee/schema/commit_result.hpp>
#include <trustee/schema/encoding/encoder.hpp>
#include <trustee/schema/event_record.hpp>
#include <trustee/schema/history_entry.hpp>
#include <trustee/schema/membership_state.hpp>
#include <trustee/schema/primitives.hpp>
#include <trustee/schema/proposal_action.hpp>
#include <trustee/schema/proposal_state.hpp>
#include <trustee/schema/query_result.hpp>
#include <trustee/schema/transaction.hpp>
#include <trustee/schema/transaction_error_code.hpp>
#include <trustee/schema/transaction_event.hpp>
#include <trustee/schema/transaction_result.hpp>
#include <trustee/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace trustee::execution {

/// Threshold-governed wallet state machine.
///
/// Participants propose one of four actions, approve or revoke, and execute
/// once the approval count reaches the threshold. Every entry point runs in
/// its own write scope: a rejected call leaves state untouched. Writes stay
/// buffered until `commit` flushes them to storage in one batch.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// `chain_id` is matched against every transaction envelope.
  explicit engine(
      trustee::schema::encoding::encoder<
          trustee::schema::encoding::scale_encoder_tag>& encoder,
      trustee::storage::storage<trustee::storage::rocksdb_storage_tag>& storage,
      const trustee::schema::hash32_t& chain_id =
          trustee::schema::make_zero_hash());

  /// Install the initial participant set and threshold. Accepted once.
  trustee::schema::transaction_result_t initialize(
      const std::vector<trustee::schema::participant_id_t>& participants,
      uint32_t threshold);

  /// Create a pending proposal carrying `action` and record the caller's
  /// approval on it.
  trustee::schema::transaction_result_t propose(
      const trustee::schema::participant_id_t& caller,
      const trustee::schema::proposal_action_t& action);
  trustee::schema::transaction_result_t propose_transfer(
      const trustee::schema::participant_id_t& caller,
      const trustee::schema::participant_id_t& destination,
      const trustee::schema::amount_t& amount);
  trustee::schema::transaction_result_t propose_add_participant(
      const trustee::schema::participant_id_t& caller,
      const trustee::schema::participant_id_t& participant);
  trustee::schema::transaction_result_t propose_remove_participant(
      const trustee::schema::participant_id_t& caller,
      const trustee::schema::participant_id_t& participant);
  trustee::schema::transaction_result_t propose_change_threshold(
      const trustee::schema::participant_id_t& caller,
      uint32_t threshold);

  trustee::schema::transaction_result_t approve(
      const trustee::schema::participant_id_t& caller,
      trustee::schema::proposal_id_t proposal_id);
  trustee::schema::transaction_result_t revoke(
      const trustee::schema::participant_id_t& caller,
      trustee::schema::proposal_id_t proposal_id);

  /// Finalize a proposal whose approval count meets the threshold and apply
  /// its action. The executed flag is set before any external transfer, so a
  /// re-entrant call on the same proposal observes it.
  trustee::schema::transaction_result_t execute(
      const trustee::schema::participant_id_t& caller,
      trustee::schema::proposal_id_t proposal_id);

  /// Credit inbound value to the custodied balance. No authorization.
  trustee::schema::transaction_result_t deposit(
      const trustee::schema::participant_id_t& from,
      const trustee::schema::amount_t& amount);

  std::optional<trustee::schema::membership_state_t> membership() const;
  trustee::schema::amount_t balance() const;
  std::optional<trustee::schema::proposal_state_t> proposal(
      trustee::schema::proposal_id_t proposal_id) const;
  std::vector<trustee::schema::proposal_state_t> pending_proposals() const;
  uint64_t proposal_count() const;
  bool has_approved(trustee::schema::proposal_id_t proposal_id,
                    const trustee::schema::participant_id_t& participant) const;
  /// Counted approval records of a proposal, read from the ledger rows.
  uint32_t approval_records(trustee::schema::proposal_id_t proposal_id) const;
  uint64_t next_nonce(const trustee::schema::participant_id_t& caller) const;

  /// Admit a transaction (CheckTx semantics): decode and envelope checks only.
  trustee::schema::transaction_result_t check_transaction(
      const trustee::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state_root.
  ///
  /// Transactions are processed in-order; per-tx results are returned even on
  /// failures.
  trustee::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<trustee::schema::bytes_t>& txs);

  /// Flush buffered writes and the committed checkpoint in one batch.
  trustee::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  trustee::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  ///
  /// Values come from the buffered view, so a finalized but uncommitted block
  /// is visible; `height` is that block's height until it commits.
  trustee::schema::query_result_t query(
      std::string_view path,
      const trustee::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<trustee::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Return persisted events in the inclusive event id range.
  std::vector<trustee::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;

  /// Install the host transfer callback. Without one, transfers are pure
  /// ledger debits.
  void set_transfer_handler(transfer_handler_t handler);

  const trustee::schema::hash32_t& chain_id() const;

 private:
  struct operation_context final {
    std::vector<trustee::schema::transaction_event_t> events;
    trustee::schema::bytes_t data;
  };
  using operation_t = std::function<std::optional<failure>(operation_context&)>;

  /// Run one state transition inside a write scope; rejected operations drop
  /// the scope and report the failure.
  trustee::schema::transaction_result_t run(std::string_view codespace,
                                            const operation_t& operation);

  /// Route a decoded transaction payload to its entry point.
  trustee::schema::transaction_result_t dispatch(
      const trustee::schema::transaction_t& tx);

  /// Type-specific effect of an executed proposal.
  std::optional<failure> apply_action(
      const trustee::schema::proposal_state_t& proposal,
      operation_context& context);

  /// Append an event to the call result and the persisted event log.
  void emit(operation_context& context, trustee::schema::transaction_event_t event);

  std::optional<failure> envelope_failure(
      const trustee::schema::transaction_t& tx) const;
  void store_balance(const trustee::schema::amount_t& amount);
  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  trustee::schema::encoding::encoder<
      trustee::schema::encoding::scale_encoder_tag>& encoder_;
  trustee::storage::storage<trustee::storage::rocksdb_storage_tag>& storage_;
  state_buffer state_;
  membership_registry membership_;
  proposal_store proposals_;
  approval_ledger approvals_;
  trustee::schema::hash32_t chain_id_;
  int64_t last_committed_height_{};
  trustee::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  trustee::schema::hash32_t pending_state_root_{};
  uint64_t current_height_{};
  uint32_t current_tx_index_{};
  transfer_handler_t transfer_handler_;
};

}  // namespace trustee::execution
