#include <boost/program_options.hpp>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

sentinel::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    sentinel::common::critical("missing required hash argument");
  }
  return sentinel::schema::make_hash32(
      std::string_view{vm[name].as<std::string>()});
}

sentinel::schema::amount_t get_decimal(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    sentinel::common::critical("missing required decimal argument");
  }
  auto value = sentinel::schema::try_from_decimal(vm[name].as<std::string>());
  if (!value) {
    sentinel::common::critical("argument is not a 256-bit decimal");
  }
  return *value;
}

std::optional<sentinel::schema::vault_id_t> get_optional_vault_id(
    const po::variables_map& vm) {
  if (!vm.contains("vault-id")) {
    return std::nullopt;
  }
  return get_decimal(vm, "vault-id");
}

/// --vault-id addresses a multi-vault record, --owner a single-vault one.
sentinel::schema::vault_ref_t get_vault_ref(const po::variables_map& vm) {
  if (vm.contains("vault-id")) {
    return sentinel::schema::vault_ref_t{get_decimal(vm, "vault-id")};
  }
  if (vm.contains("owner")) {
    return sentinel::schema::vault_ref_t{get_hash32(vm, "owner")};
  }
  sentinel::common::critical("vault reference requires --vault-id or --owner");
}

template <std::size_t N>
std::array<uint8_t, N> get_fixed_bytes(const std::string& hex,
                                       const std::string_view what) {
  auto bytes = sentinel::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    std::cerr << what << " must be " << N << " hex encoded bytes\n";
    sentinel::common::critical("invalid fixed size byte argument");
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

sentinel::schema::signer_id_t make_signer(const po::variables_map& vm) {
  if (!vm.contains("signer")) {
    sentinel::common::critical("transaction mode requires --signer");
  }
  auto kind = vm["signer-kind"].as<std::string>();
  auto value = vm["signer"].as<std::string>();
  if (kind == "named") {
    return sentinel::schema::signer_id_t{
        sentinel::schema::make_hash32(std::string_view{value})};
  }
  if (kind == "ed25519") {
    return sentinel::schema::signer_id_t{sentinel::schema::ed25519_signer_id{
        .public_key = get_fixed_bytes<32>(value, "ed25519 public key")}};
  }
  if (kind == "secp256k1") {
    return sentinel::schema::signer_id_t{sentinel::schema::secp256k1_signer_id{
        .public_key = get_fixed_bytes<33>(value, "secp256k1 public key")}};
  }
  sentinel::common::critical("unsupported signer-kind");
}

sentinel::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  if (kind == "ed25519") {
    if (hex.empty()) {
      return sentinel::schema::signature_t{
          sentinel::schema::ed25519_signature_t{}};
    }
    return sentinel::schema::signature_t{
        get_fixed_bytes<64>(hex, "ed25519 signature")};
  }
  if (kind == "secp256k1") {
    if (hex.empty()) {
      return sentinel::schema::signature_t{
          sentinel::schema::secp256k1_signature_t{}};
    }
    // A bare r || s signature gets a trailing recovery id of 27.
    if (hex.size() == 128) {
      auto rs = get_fixed_bytes<64>(hex, "secp256k1 signature");
      auto signature = sentinel::schema::secp256k1_signature_t{};
      std::copy(std::begin(rs), std::end(rs), std::begin(signature));
      signature.back() = 27;
      return sentinel::schema::signature_t{signature};
    }
    return sentinel::schema::signature_t{
        get_fixed_bytes<65>(hex, "secp256k1 signature")};
  }
  sentinel::common::critical("unsupported signature-kind");
}

sentinel::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto name = vm["payload"].as<std::string>();
  auto operation =
      sentinel::schema::try_from_string<sentinel::schema::operation_type_t>(
          name);
  if (!operation) {
    std::cerr << "payload must be one of "
              << sentinel::schema::joined_names(
                     sentinel::schema::kOperationTypeMappings)
              << '\n';
    sentinel::common::critical("unsupported payload type");
  }

  switch (*operation) {
    case sentinel::schema::operation_type_t::create_vault:
      return sentinel::schema::create_vault_t{
          .beneficiary = get_hash32(vm, "beneficiary")};
    case sentinel::schema::operation_type_t::check_in:
      return sentinel::schema::check_in_t{.vault_id = get_optional_vault_id(vm)};
    case sentinel::schema::operation_type_t::deposit:
      return sentinel::schema::deposit_t{.vault_id = get_optional_vault_id(vm),
                                         .amount = get_decimal(vm, "amount")};
    case sentinel::schema::operation_type_t::set_beneficiary:
      return sentinel::schema::set_beneficiary_t{
          .vault_id = get_optional_vault_id(vm),
          .beneficiary = get_hash32(vm, "beneficiary")};
    case sentinel::schema::operation_type_t::trigger_tier1:
      return sentinel::schema::trigger_tier1_t{.target = get_vault_ref(vm)};
    case sentinel::schema::operation_type_t::trigger_tier2:
      return sentinel::schema::trigger_tier2_t{.target = get_vault_ref(vm)};
  }
  sentinel::common::critical("unsupported payload type");
}

sentinel::schema::transaction_t build_transaction(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    sentinel::common::critical("transaction mode requires --payload");
  }
  auto chain_id =
      vm.contains("chain-id")
          ? get_hash32(vm, "chain-id")
          : sentinel::blake3::hash(std::string_view{"sentinel-chain"});
  return sentinel::schema::transaction_t{.version = 1,
                                         .chain_id = chain_id,
                                         .nonce = vm["nonce"].as<uint64_t>(),
                                         .signer = make_signer(vm),
                                         .payload = build_payload(vm),
                                         .signature = make_signature(vm)};
}

sentinel::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/keyspaces" ||
      path == "/config/fee" || path == "/config/global") {
    return {};
  }
  if (path == "/vault/status" || path == "/vault/beneficiary" ||
      path == "/vault/exists") {
    return encoder.encode(get_vault_ref(vm));
  }
  if (path == "/vault/count") {
    return encoder.encode(get_hash32(vm, "owner"));
  }
  if (path == "/vault/id_by_index") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "owner"), vm["index"].as<uint64_t>()});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  sentinel::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder signing-message [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-message|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "create_vault|check_in|deposit|set_beneficiary|trigger_tier1|"
      "trigger_tier2")("path", po::value<std::string>(), "host query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer hash32 or public key hex")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "signature bytes hex (secp256k1 also takes bare r || s)")(
      "vault-id", po::value<std::string>(), "multi-vault id (decimal)")(
      "owner", po::value<std::string>(), "vault owner address hex")(
      "beneficiary", po::value<std::string>(), "beneficiary address hex")(
      "amount", po::value<std::string>(), "deposit amount (decimal)")(
      "index", po::value<uint64_t>()->default_value(0),
      "position in the owner's vault list")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

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
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << sentinel::schema::to_base64(
                     sentinel::schema::bytes_view_t{encoded})
              << '\n';
    return 0;
  }

  if (command == "signing-message") {
    auto encoder = encoder_t{};
    auto message =
        sentinel::schema::signing_bytes(encoder, build_transaction(vm));
    std::cout << sentinel::schema::to_base64(
                     sentinel::schema::bytes_view_t{message})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      sentinel::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << sentinel::schema::to_base64(
                     sentinel::schema::bytes_view_t{key})
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id =
        sentinel::blake3::hash(std::string_view{"sentinel-chain"});
    std::cout << sentinel::schema::to_hex(
                     sentinel::schema::bytes_view_t{chain_id})
              << '\n';
    return 0;
  }

  sentinel::common::critical(
      "command must be transaction|signing-message|query-key|chain-id");
}
