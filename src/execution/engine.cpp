#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <trustee/blake3/hash.hpp>
#include <trustee/execution/engine.hpp>
#include <trustee/schema/encoding/scale/encoder.hpp>
#include <trustee/schema/key/engine_keys.hpp>
#include <trustee/schema/query_error_code.hpp>
#include <tuple>
#include <utility>

using namespace trustee::schema;

namespace {

using encoder_t = trustee::schema::encoding::encoder<
    trustee::schema::encoding::scale_encoder_tag>;

trustee::schema::hash32_t fold_state_root(
    const trustee::schema::hash32_t& seed,
    const trustee::schema::bytes_t& tx,
    uint64_t height,
    uint32_t index) {
  auto material = trustee::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 12);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return trustee::blake3::hash(
      trustee::schema::bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_failure_result(
    const trustee::execution::failure& rejected,
    const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(rejected.code);
  result.log = rejected.log;
  result.info = rejected.info;
  result.codespace = std::string{codespace};
  return result;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = true) {
  auto attribute = transaction_event_attribute_t{};
  attribute.key = std::move(key);
  attribute.value = std::move(value);
  attribute.index = index;
  return attribute;
}

transaction_event_t make_event(
    std::string type,
    std::vector<transaction_event_attribute_t> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  event.attributes = std::move(attributes);
  return event;
}

std::string hex(const participant_id_t& id) {
  return to_hex(bytes_view_t{id.data(), id.size()});
}

std::string describe(const proposal_action_t& action) {
  return std::visit(
      overloaded{[](const transfer_action_t& transfer) {
                   return "transfer " + transfer.amount.str() + " to " +
                          hex(transfer.destination);
                 },
                 [](const add_participant_action_t& add) {
                   return "add participant " + hex(add.participant);
                 },
                 [](const remove_participant_action_t& remove) {
                   return "remove participant " + hex(remove.participant);
                 },
                 [](const change_threshold_action_t& change) {
                   return "change threshold to " +
                          std::to_string(change.threshold);
                 }},
      action);
}

}  // namespace

namespace trustee::execution {

engine::engine(encoder_t& encoder,
               trustee::storage::storage<trustee::storage::rocksdb_storage_tag>&
                   storage,
               const hash32_t& chain_id)
    : encoder_{encoder},
      storage_{storage},
      state_{encoder, storage},
      membership_{state_},
      proposals_{state_},
      approvals_{state_, proposals_},
      chain_id_{chain_id} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} (chain {})",
               last_committed_height_,
               hex(chain_id_));
}

transaction_result_t engine::initialize(
    const std::vector<participant_id_t>& participants,
    const uint32_t threshold) {
  return run("trustee.initialize", [&](operation_context& context)
                                       -> std::optional<failure> {
    if (auto rejected = membership_.initialize(participants, threshold)) {
      return rejected;
    }
    emit(context,
         make_event("wallet_initialized",
                    {make_attribute("participants",
                                    std::to_string(participants.size())),
                     make_attribute("threshold", std::to_string(threshold))}));
    spdlog::info("Wallet initialized with {} participant(s), threshold {}",
                 participants.size(), threshold);
    return std::nullopt;
  });
}

transaction_result_t engine::propose(const participant_id_t& caller,
                                     const proposal_action_t& action) {
  return run("trustee.propose", [&](operation_context& context)
                                    -> std::optional<failure> {
    if (!membership_.initialized()) {
      return fail(transaction_error_code::wallet_not_initialized,
                  "wallet not initialized");
    }
    if (!membership_.is_participant(caller)) {
      return fail(transaction_error_code::authorization_denied,
                  "caller is not a participant", hex(caller));
    }

    auto rejected = std::visit(
        overloaded{
            [&](const transfer_action_t& transfer) -> std::optional<failure> {
              if (is_null(transfer.destination)) {
                return fail(transaction_error_code::invalid_participant,
                            "null transfer destination");
              }
              if (transfer.amount == 0) {
                return fail(transaction_error_code::invalid_amount,
                            "transfer amount must be positive");
              }
              return std::nullopt;
            },
            [&](const add_participant_action_t& add) {
              return membership_.validate_add(add.participant);
            },
            [&](const remove_participant_action_t& remove) {
              return membership_.validate_remove(remove.participant);
            },
            [&](const change_threshold_action_t& change) {
              return membership_.validate_threshold(change.threshold);
            }},
        action);
    if (rejected) {
      return rejected;
    }

    auto proposal = proposals_.create(caller, action);
    emit(context,
         make_event(
             "proposal_created",
             {make_attribute("proposal_id",
                             std::to_string(proposal.proposal_id)),
              make_attribute("proposer", hex(caller)),
              make_attribute("action",
                             std::string{to_string(action_type(action))}),
              make_attribute("payload", to_hex(encoder_.encode(action)),
                             false)}));

    approvals_.record(proposal, caller);
    emit(context,
         make_event("approval_granted",
                    {make_attribute("proposal_id",
                                    std::to_string(proposal.proposal_id)),
                     make_attribute("participant", hex(caller)),
                     make_attribute("approvals",
                                    std::to_string(proposal.approvals_count),
                                    false)}));

    context.data = encoder_.encode(proposal.proposal_id);
    return std::nullopt;
  });
}

transaction_result_t engine::propose_transfer(
    const participant_id_t& caller,
    const participant_id_t& destination,
    const amount_t& amount) {
  return propose(caller, transfer_action_t{.destination = destination,
                                           .amount = amount});
}

transaction_result_t engine::propose_add_participant(
    const participant_id_t& caller,
    const participant_id_t& participant) {
  return propose(caller, add_participant_action_t{.participant = participant});
}

transaction_result_t engine::propose_remove_participant(
    const participant_id_t& caller,
    const participant_id_t& participant) {
  return propose(caller,
                 remove_participant_action_t{.participant = participant});
}

transaction_result_t engine::propose_change_threshold(
    const participant_id_t& caller,
    const uint32_t threshold) {
  return propose(caller, change_threshold_action_t{.threshold = threshold});
}

transaction_result_t engine::approve(const participant_id_t& caller,
                                     const proposal_id_t proposal_id) {
  return run("trustee.approve", [&](operation_context& context)
                                    -> std::optional<failure> {
    auto proposal = proposals_.find(proposal_id);
    if (!proposal) {
      return fail(transaction_error_code::proposal_missing,
                  "proposal not found", std::to_string(proposal_id));
    }
    if (proposal->status != proposal_status_t::pending) {
      return fail(transaction_error_code::proposal_not_pending,
                  "proposal is not pending", std::to_string(proposal_id));
    }
    if (!membership_.is_participant(caller)) {
      return fail(transaction_error_code::authorization_denied,
                  "caller is not a participant", hex(caller));
    }
    if (approvals_.has_approved(proposal_id, caller)) {
      return fail(transaction_error_code::duplicate_approval,
                  "caller already approved", std::to_string(proposal_id));
    }

    approvals_.record(*proposal, caller);
    emit(context,
         make_event("approval_granted",
                    {make_attribute("proposal_id", std::to_string(proposal_id)),
                     make_attribute("participant", hex(caller)),
                     make_attribute("approvals",
                                    std::to_string(proposal->approvals_count),
                                    false)}));
    return std::nullopt;
  });
}

transaction_result_t engine::revoke(const participant_id_t& caller,
                                    const proposal_id_t proposal_id) {
  return run("trustee.revoke", [&](operation_context& context)
                                   -> std::optional<failure> {
    auto proposal = proposals_.find(proposal_id);
    if (!proposal) {
      return fail(transaction_error_code::proposal_missing,
                  "proposal not found", std::to_string(proposal_id));
    }
    if (proposal->status != proposal_status_t::pending) {
      return fail(transaction_error_code::proposal_not_pending,
                  "proposal is not pending", std::to_string(proposal_id));
    }
    if (!membership_.is_participant(caller)) {
      return fail(transaction_error_code::authorization_denied,
                  "caller is not a participant", hex(caller));
    }
    if (!approvals_.has_approved(proposal_id, caller)) {
      return fail(transaction_error_code::approval_missing,
                  "caller has not approved", std::to_string(proposal_id));
    }

    approvals_.clear(*proposal, caller);
    emit(context,
         make_event("approval_revoked",
                    {make_attribute("proposal_id", std::to_string(proposal_id)),
                     make_attribute("participant", hex(caller)),
                     make_attribute("approvals",
                                    std::to_string(proposal->approvals_count),
                                    false)}));
    return std::nullopt;
  });
}

transaction_result_t engine::execute(const participant_id_t& caller,
                                     const proposal_id_t proposal_id) {
  return run("trustee.execute", [&](operation_context& context)
                                    -> std::optional<failure> {
    auto proposal = proposals_.find(proposal_id);
    if (!proposal) {
      return fail(transaction_error_code::proposal_missing,
                  "proposal not found", std::to_string(proposal_id));
    }
    if (proposal->status != proposal_status_t::pending) {
      return fail(transaction_error_code::proposal_not_pending,
                  "proposal is not pending", std::to_string(proposal_id));
    }
    auto membership = membership_.load();
    if (!membership ||
        !std::ranges::binary_search(membership->participants, caller)) {
      return fail(transaction_error_code::authorization_denied,
                  "caller is not a participant", hex(caller));
    }
    if (proposal->approvals_count < membership->threshold) {
      return fail(transaction_error_code::insufficient_approvals,
                  "approval threshold not met",
                  std::to_string(proposal->approvals_count) + " of " +
                      std::to_string(membership->threshold));
    }

    proposal->status = proposal_status_t::executed;
    proposals_.save(*proposal);
    approvals_.release(*proposal);

    if (auto rejected = apply_action(*proposal, context)) {
      return rejected;
    }
    emit(context,
         make_event(
             "proposal_executed",
             {make_attribute("proposal_id", std::to_string(proposal_id)),
              make_attribute("action", std::string{to_string(
                                           action_type(proposal->action))}),
              make_attribute("effect", describe(proposal->action), false)}));
    context.data = encoder_.encode(proposal_id);
    return std::nullopt;
  });
}

transaction_result_t engine::deposit(const participant_id_t& from,
                                     const amount_t& amount) {
  return run("trustee.deposit", [&](operation_context& context)
                                    -> std::optional<failure> {
    auto current = balance();
    if (amount > std::numeric_limits<amount_t>::max() - current) {
      return fail(transaction_error_code::invalid_amount,
                  "deposit overflows custodied balance", amount.str());
    }
    auto updated = current + amount;
    store_balance(updated);
    emit(context,
         make_event("deposit_received",
                    {make_attribute("sender", hex(from)),
                     make_attribute("amount", amount.str(), false),
                     make_attribute("balance", updated.str(), false)}));
    return std::nullopt;
  });
}

std::optional<membership_state_t> engine::membership() const {
  auto lock = std::scoped_lock{mutex_};
  return membership_.load();
}

amount_t engine::balance() const {
  auto lock = std::scoped_lock{mutex_};
  auto row_key = key::make_prefix_key(encoder_, key::kBalanceKey);
  return state_.load<amount_t>(make_bytes_view(row_key)).value_or(amount_t{0});
}

std::optional<proposal_state_t> engine::proposal(
    const proposal_id_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.find(proposal_id);
}

std::vector<proposal_state_t> engine::pending_proposals() const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.pending();
}

uint64_t engine::proposal_count() const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.next_id();
}

bool engine::has_approved(const proposal_id_t proposal_id,
                          const participant_id_t& participant) const {
  auto lock = std::scoped_lock{mutex_};
  return approvals_.has_approved(proposal_id, participant);
}

uint32_t engine::approval_records(const proposal_id_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return approvals_.count_records(proposal_id);
}

uint64_t engine::next_nonce(const participant_id_t& caller) const {
  auto lock = std::scoped_lock{mutex_};
  auto row_key = key::make_nonce_key(encoder_, caller);
  return state_.load<uint64_t>(make_bytes_view(row_key)).value_or(0);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_failure_result(
        failure{.code = transaction_error_code::invalid_transaction,
                .log = "invalid transaction",
                .info = "failed to decode transaction envelope"},
        "trustee.checktx");
  }
  if (auto rejected = envelope_failure(*maybe_tx)) {
    return make_failure_result(*rejected, "trustee.checktx");
  }
  return transaction_result_t{};
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  current_height_ = height;

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    current_tx_index_ = static_cast<uint32_t>(i);
    auto tx_result = transaction_result_t{};
    auto maybe_tx =
        encoder_.try_decode<transaction_t>(make_bytes_view(txs[i]));
    if (!maybe_tx) {
      tx_result = make_failure_result(
          failure{.code = transaction_error_code::invalid_transaction,
                  .log = "invalid transaction",
                  .info = "failed to decode transaction envelope"},
          "trustee.finalize");
    } else if (auto rejected = envelope_failure(*maybe_tx)) {
      tx_result = make_failure_result(*rejected, "trustee.finalize");
    } else if (auto expected = next_nonce(maybe_tx->caller);
               maybe_tx->nonce != expected) {
      tx_result = make_failure_result(
          failure{.code = transaction_error_code::invalid_nonce,
                  .log = "invalid nonce",
                  .info = "expected " + std::to_string(expected) + ", got " +
                          std::to_string(maybe_tx->nonce)},
          "trustee.finalize");
    } else {
      tx_result = dispatch(*maybe_tx);
      if (tx_result.code == 0) {
        auto nonce_key = key::make_nonce_key(encoder_, maybe_tx->caller);
        state_.store(make_bytes_view(nonce_key), expected + 1);
      }
    }

    auto entry = history_entry_t{};
    entry.height = height;
    entry.index = current_tx_index_;
    entry.code = tx_result.code;
    entry.tx = txs[i];
    auto history_key = key::make_history_key(encoder_, height, entry.index);
    state_.store(make_bytes_view(history_key), entry);

    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, entry.index);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  current_tx_index_ = 0;
  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  storage_.apply(state_.take_writes(),
                 trustee::storage::committed_state{
                     .height = last_committed_height_,
                     .state_root = last_committed_state_root_});
  current_height_ = static_cast<uint64_t>(last_committed_height_) + 1;
  spdlog::info("Committed height {} with state root {}",
               last_committed_height_, hex(last_committed_state_root_));

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height =
      pending_height_ > 0 ? pending_height_ : last_committed_height_;

  auto reject = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    result.info = std::string{path};
    result.codespace = "trustee.query";
    return result;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }
  if (path == "/wallet/membership") {
    auto membership = membership_.load();
    if (!membership) {
      return reject(query_error_code::not_found, "wallet not initialized");
    }
    result.value = encoder_.encode(*membership);
    return result;
  }
  if (path == "/wallet/balance") {
    result.value = encoder_.encode(balance());
    return result;
  }
  if (path == "/proposal") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return reject(query_error_code::invalid_key, "expected proposal id");
    }
    auto proposal = proposals_.find(*proposal_id);
    if (!proposal) {
      return reject(query_error_code::not_found, "proposal not found");
    }
    result.value = encoder_.encode(*proposal);
    return result;
  }
  if (path == "/approval") {
    auto approval_key =
        encoder_.try_decode<std::tuple<proposal_id_t, participant_id_t>>(data);
    if (!approval_key) {
      return reject(query_error_code::invalid_key,
                    "expected (proposal id, participant)");
    }
    const auto& [proposal_id, participant] = *approval_key;
    if (!proposals_.find(proposal_id)) {
      return reject(query_error_code::not_found, "proposal not found");
    }
    result.value =
        encoder_.encode(approvals_.has_approved(proposal_id, participant));
    return result;
  }
  if (path == "/proposals/pending") {
    result.value = encoder_.encode(proposals_.pending());
    return result;
  }
  if (path == "/events/range" || path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return reject(query_error_code::invalid_key, "expected (from, to)");
    }
    result.value =
        path == "/events/range"
            ? encoder_.encode(events(std::get<0>(*range), std::get<1>(*range)))
            : encoder_.encode(
                  history(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }
  return reject(query_error_code::unsupported_path, "unsupported query path");
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_prefix_key(encoder_, key::kHistoryPrefix);
  auto rows = std::vector<history_entry_t>{};
  for (const auto& entry : state_.list_by_prefix(make_bytes_view(prefix))) {
    auto row = encoder_.decode<history_entry_t>(make_bytes_view(entry.second));
    if (row.height >= from_height && row.height <= to_height) {
      rows.push_back(std::move(row));
    }
  }
  std::ranges::sort(rows, [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.height, lhs.index) < std::tie(rhs.height, rhs.index);
  });
  return rows;
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_prefix_key(encoder_, key::kEventPrefix);
  auto records = std::vector<event_record_t>{};
  for (const auto& entry : state_.list_by_prefix(make_bytes_view(prefix))) {
    auto record = encoder_.decode<event_record_t>(make_bytes_view(entry.second));
    if (record.event_id >= from_id && record.event_id <= to_id) {
      records.push_back(std::move(record));
    }
  }
  std::ranges::sort(records, {}, &event_record_t::event_id);
  return records;
}

void engine::set_transfer_handler(transfer_handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  transfer_handler_ = std::move(handler);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

transaction_result_t engine::run(const std::string_view codespace,
                                 const operation_t& operation) {
  auto lock = std::scoped_lock{mutex_};
  auto context = operation_context{};
  auto scope = write_scope{state_};
  if (auto rejected = operation(context)) {
    spdlog::warn("{} rejected: {} ({})", codespace, rejected->log,
                 rejected->info);
    return make_failure_result(*rejected, codespace);
  }
  scope.commit();
  spdlog::debug("{} applied with {} event(s)", codespace,
                context.events.size());

  auto result = transaction_result_t{};
  result.data = std::move(context.data);
  result.events = std::move(context.events);
  return result;
}

transaction_result_t engine::dispatch(const transaction_t& tx) {
  return std::visit(
      overloaded{[&](const initialize_wallet_t& payload) {
                   return initialize(payload.participants, payload.threshold);
                 },
                 [&](const propose_action_t& payload) {
                   return propose(tx.caller, payload.action);
                 },
                 [&](const approve_proposal_t& payload) {
                   return approve(tx.caller, payload.proposal_id);
                 },
                 [&](const revoke_approval_t& payload) {
                   return revoke(tx.caller, payload.proposal_id);
                 },
                 [&](const execute_proposal_t& payload) {
                   return execute(tx.caller, payload.proposal_id);
                 },
                 [&](const deposit_t& payload) {
                   return deposit(tx.caller, payload.amount);
                 }},
      tx.payload);
}

std::optional<failure> engine::apply_action(const proposal_state_t& proposal,
                                            operation_context& context) {
  return std::visit(
      overloaded{
          [&](const transfer_action_t& transfer) -> std::optional<failure> {
            auto available = balance();
            if (available < transfer.amount) {
              return fail(transaction_error_code::insufficient_balance,
                          "insufficient balance",
                          "balance " + available.str() + ", requested " +
                              transfer.amount.str());
            }
            auto remaining = available - transfer.amount;
            store_balance(remaining);
            emit(context,
                 make_event("transfer_sent",
                            {make_attribute("destination",
                                            hex(transfer.destination)),
                             make_attribute("amount", transfer.amount.str(),
                                            false),
                             make_attribute("balance", remaining.str(),
                                            false)}));

            // The handler may replace itself through set_transfer_handler.
            auto handler = transfer_handler_;
            if (!handler) {
              return std::nullopt;
            }
            auto delivered = false;
            try {
              delivered = handler(transfer.destination, transfer.amount);
            } catch (const std::exception& ex) {
              return fail(transaction_error_code::transfer_failed,
                          "transfer handler failed", ex.what());
            } catch (...) {
              return fail(transaction_error_code::transfer_failed,
                          "transfer handler failed", "non-standard exception");
            }
            if (!delivered) {
              return fail(transaction_error_code::transfer_failed,
                          "transfer handler rejected transfer",
                          hex(transfer.destination));
            }
            return std::nullopt;
          },
          [&](const add_participant_action_t& add) -> std::optional<failure> {
            if (auto rejected = membership_.add(add.participant)) {
              return rejected;
            }
            emit(context,
                 make_event("participant_added",
                            {make_attribute("participant",
                                            hex(add.participant)),
                             make_attribute(
                                 "participants",
                                 std::to_string(membership_.load()
                                                    ->participants.size()),
                                 false)}));
            return std::nullopt;
          },
          [&](const remove_participant_action_t& remove)
              -> std::optional<failure> {
            if (auto rejected = membership_.remove(remove.participant)) {
              return rejected;
            }
            emit(context,
                 make_event("participant_removed",
                            {make_attribute("participant",
                                            hex(remove.participant)),
                             make_attribute(
                                 "participants",
                                 std::to_string(membership_.load()
                                                    ->participants.size()),
                                 false)}));
            for (const auto& swept : approvals_.sweep(remove.participant)) {
              emit(context,
                   make_event(
                       "approval_swept",
                       {make_attribute("proposal_id",
                                       std::to_string(swept.proposal_id)),
                        make_attribute("participant", hex(remove.participant)),
                        make_attribute("approvals",
                                       std::to_string(swept.remaining),
                                       false)}));
            }
            return std::nullopt;
          },
          [&](const change_threshold_action_t& change)
              -> std::optional<failure> {
            auto previous = membership_.load().value().threshold;
            if (auto rejected = membership_.change_threshold(change.threshold)) {
              return rejected;
            }
            emit(context,
                 make_event(
                     "threshold_changed",
                     {make_attribute("old", std::to_string(previous), false),
                      make_attribute("new", std::to_string(change.threshold),
                                     false)}));
            return std::nullopt;
          }},
      proposal.action);
}

void engine::emit(operation_context& context, transaction_event_t event) {
  auto seq_key = key::make_prefix_key(encoder_, key::kEventSeqKey);
  auto event_id = state_.load<uint64_t>(make_bytes_view(seq_key)).value_or(0);

  auto record = event_record_t{};
  record.event_id = event_id;
  record.height = current_height_;
  record.tx_index = current_tx_index_;
  record.event = event;
  auto event_key = key::make_event_key(encoder_, event_id);
  state_.store(make_bytes_view(event_key), record);
  state_.store(make_bytes_view(seq_key), event_id + 1);

  context.events.push_back(std::move(event));
}

std::optional<failure> engine::envelope_failure(const transaction_t& tx) const {
  if (tx.version != 1) {
    return fail(transaction_error_code::unsupported_transaction_version,
                "unsupported transaction version", "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return fail(transaction_error_code::invalid_chain_id, "invalid chain id",
                hex(tx.chain_id));
  }
  return std::nullopt;
}

void engine::store_balance(const amount_t& amount) {
  auto row_key = key::make_prefix_key(encoder_, key::kBalanceKey);
  state_.store(make_bytes_view(row_key), amount);
}

void engine::load_persisted_state() {
  auto committed = storage_.load_committed_state();
  if (!committed) {
    last_committed_height_ = 0;
    last_committed_state_root_ = make_zero_hash();
    storage_.save_committed_state(trustee::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  } else {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;
  current_height_ = static_cast<uint64_t>(last_committed_height_) + 1;
}

}  // namespace trustee::execution
