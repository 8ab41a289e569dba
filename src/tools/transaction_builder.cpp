#include <boost/program_options.hpp>
#include <trustee/common/critical.hpp>
#include <trustee/schema/encoding/scale/encoder.hpp>
#include <trustee/schema/proposal_state.hpp>
#include <trustee/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = trustee::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

std::string hex(const trustee::schema::hash32_t& id) {
  return trustee::schema::to_hex(
      trustee::schema::bytes_view_t{id.data(), id.size()});
}

trustee::schema::participant_id_t get_identity(const po::variables_map& vm,
                                               const std::string& name) {
  if (!vm.contains(name)) {
    trustee::common::critical("missing required identity argument");
  }
  return trustee::schema::parse_identity(vm[name].as<std::string>());
}

// --participant is repeatable for initialize_wallet; single-identity uses
// take the first value.
trustee::schema::participant_id_t get_participant(const po::variables_map& vm) {
  if (!vm.contains("participant")) {
    trustee::common::critical("missing required --participant");
  }
  return trustee::schema::parse_identity(
      vm["participant"].as<std::vector<std::string>>().front());
}

trustee::schema::amount_t get_amount(const po::variables_map& vm) {
  auto amount =
      trustee::schema::try_make_amount(vm["amount"].as<std::string>());
  if (!amount) {
    trustee::common::critical("amount must be a decimal 256-bit value");
  }
  return *amount;
}

uint64_t get_proposal_id(const po::variables_map& vm) {
  if (!vm.contains("proposal-id")) {
    trustee::common::critical("missing required --proposal-id");
  }
  return vm["proposal-id"].as<uint64_t>();
}

trustee::schema::proposal_action_t build_action(const po::variables_map& vm) {
  if (!vm.contains("action")) {
    trustee::common::critical("propose_action requires --action");
  }
  auto action = trustee::schema::try_from_string<trustee::schema::action_type_t>(
      vm["action"].as<std::string>());
  if (!action) {
    trustee::common::critical(
        "action must be "
        "transfer|add_participant|remove_participant|change_threshold");
  }
  switch (*action) {
    case trustee::schema::action_type_t::transfer:
      return trustee::schema::transfer_action_t{
          .destination = get_identity(vm, "destination"),
          .amount = get_amount(vm)};
    case trustee::schema::action_type_t::add_participant:
      return trustee::schema::add_participant_action_t{
          .participant = get_participant(vm)};
    case trustee::schema::action_type_t::remove_participant:
      return trustee::schema::remove_participant_action_t{
          .participant = get_participant(vm)};
    case trustee::schema::action_type_t::change_threshold:
      return trustee::schema::change_threshold_action_t{
          .threshold = vm["threshold"].as<uint32_t>()};
  }
  trustee::common::critical("unhandled action type");
}

trustee::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "initialize_wallet") {
    auto participants = std::vector<trustee::schema::participant_id_t>{};
    if (vm.contains("participant")) {
      for (const auto& value :
           vm["participant"].as<std::vector<std::string>>()) {
        participants.push_back(trustee::schema::parse_identity(value));
      }
    }
    return trustee::schema::initialize_wallet_t{
        .participants = participants,
        .threshold = vm["threshold"].as<uint32_t>()};
  }
  if (payload == "propose_action") {
    return trustee::schema::propose_action_t{.action = build_action(vm)};
  }
  if (payload == "approve_proposal") {
    return trustee::schema::approve_proposal_t{.proposal_id =
                                                   get_proposal_id(vm)};
  }
  if (payload == "revoke_approval") {
    return trustee::schema::revoke_approval_t{.proposal_id =
                                                  get_proposal_id(vm)};
  }
  if (payload == "execute_proposal") {
    return trustee::schema::execute_proposal_t{.proposal_id =
                                                   get_proposal_id(vm)};
  }
  if (payload == "deposit") {
    return trustee::schema::deposit_t{.amount = get_amount(vm)};
  }
  trustee::common::critical("unsupported payload type");
}

trustee::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/wallet/membership" ||
      path == "/wallet/balance" || path == "/proposals/pending") {
    return {};
  }
  if (path == "/proposal") {
    return encoder.encode(get_proposal_id(vm));
  }
  if (path == "/approval") {
    return encoder.encode(
        std::tuple{get_proposal_id(vm), get_participant(vm)});
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  trustee::common::critical("unsupported query path");
}

void print_action(const trustee::schema::proposal_action_t& action) {
  std::cout << "action=" << to_string(trustee::schema::action_type(action))
            << '\n';
  std::visit(
      overloaded{[](const trustee::schema::transfer_action_t& transfer) {
                   std::cout << "destination=" << hex(transfer.destination)
                             << '\n'
                             << "amount=" << transfer.amount.str() << '\n';
                 },
                 [](const trustee::schema::add_participant_action_t& add) {
                   std::cout << "participant=" << hex(add.participant) << '\n';
                 },
                 [](const trustee::schema::remove_participant_action_t&
                        remove) {
                   std::cout << "participant=" << hex(remove.participant)
                             << '\n';
                 },
                 [](const trustee::schema::change_threshold_action_t& change) {
                   std::cout << "threshold=" << change.threshold << '\n';
                 }},
      action);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder decode-proposal --data <base64>\n"
            << "  transaction_builder chain-id [--chain-id <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|decode-proposal|chain-id")(
      "payload", po::value<std::string>(),
      "initialize_wallet|propose_action|approve_proposal|revoke_approval|"
      "execute_proposal|deposit")("path", po::value<std::string>(),
                                  "query path")(
      "chain-id", po::value<std::string>()->default_value("trustee-local-chain"),
      "chain id hex or name")("nonce", po::value<uint64_t>()->default_value(0),
                              "caller nonce")(
      "caller", po::value<std::string>(), "caller identity hex or name")(
      "action", po::value<std::string>(),
      "transfer|add_participant|remove_participant|change_threshold")(
      "participant", po::value<std::vector<std::string>>()->multitoken(),
      "participant identity hex or name")(
      "threshold", po::value<uint32_t>()->default_value(1),
      "approval threshold")("destination", po::value<std::string>(),
                            "transfer destination hex or name")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal amount")("proposal-id", po::value<uint64_t>(), "proposal id")(
      "from", po::value<uint64_t>()->default_value(0), "range start")(
      "to", po::value<uint64_t>()->default_value(0), "range end")(
      "data", po::value<std::string>(), "base64 SCALE bytes to decode");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      trustee::common::critical("transaction mode requires --payload");
    }
    auto transaction = trustee::schema::transaction_t{
        .version = 1,
        .chain_id = trustee::schema::parse_identity(
            vm["chain-id"].as<std::string>()),
        .nonce = vm["nonce"].as<uint64_t>(),
        .caller = get_identity(vm, "caller"),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << trustee::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      trustee::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << trustee::schema::to_hex(
                     trustee::schema::bytes_view_t{key.data(), key.size()})
              << '\n';
    return 0;
  }

  if (command == "decode-proposal") {
    if (!vm.contains("data")) {
      trustee::common::critical("decode-proposal mode requires --data");
    }
    auto raw = trustee::schema::from_base64(vm["data"].as<std::string>());
    auto proposal = encoder_t{}.try_decode<trustee::schema::proposal_state_t>(
        trustee::schema::bytes_view_t{raw.data(), raw.size()});
    if (!proposal) {
      trustee::common::critical("data is not a SCALE proposal_state");
    }
    std::cout << "proposal_id=" << proposal->proposal_id << '\n'
              << "proposer=" << hex(proposal->proposer) << '\n'
              << "status=" << to_string(proposal->status) << '\n'
              << "approvals=" << proposal->approvals_count << '\n';
    print_action(proposal->action);
    return 0;
  }

  if (command == "chain-id") {
    std::cout << hex(trustee::schema::parse_identity(
                     vm["chain-id"].as<std::string>()))
              << '\n';
    return 0;
  }

  trustee::common::critical(
      "command must be transaction|query-key|decode-proposal|chain-id");
}
