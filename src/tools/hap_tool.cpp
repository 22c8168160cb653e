#include <boost/program_options.hpp>
#include <hap/attestation/signer.hpp>
#include <hap/attestation/text_block.hpp>
#include <hap/attestation/verifier.hpp>
#include <hap/common/critical.hpp>
#include <hap/crypto/key_registry.hpp>
#include <hap/crypto/signing_context.hpp>
#include <hap/disclosure/canonical.hpp>
#include <hap/execution/authorizer.hpp>
#include <hap/frame/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/sdg/catalogue.hpp>
#include <hap/sdg/engine.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace hap::schema;

constexpr auto kExitRejected = 1;
constexpr auto kExitHardStop = 2;

void init_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::async_logger>(
      "hap_tool", spdlog::sinks_init_list{console_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    hap::common::critical("cannot open " + path);
  }
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    hap::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

std::vector<std::string> many(const po::variables_map& vm,
                              const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

int report(const hap::schema::error_t& error) {
  std::cerr << "error: " << to_string(error.code) << ": " << error.log << '\n';
  for (const auto& violation : error.violations) {
    std::cerr << "  - " << violation << '\n';
  }
  return kExitRejected;
}

timestamp_seconds_t now_seconds(const po::variables_map& vm) {
  if (vm.contains("now")) {
    return vm["now"].as<int64_t>();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

const profile_t& selected_profile(const po::variables_map& vm) {
  auto profile = hap::profile::resolve_profile(require(vm, "profile"));
  if (!profile) {
    hap::common::critical(profile.error().log);
  }
  return *profile.value();
}

hap::frame::deploy_frame_t make_frame(const po::variables_map& vm,
                                      const profile_t& profile) {
  auto frame = hap::frame::deploy_frame_t{.repo = require(vm, "repo"),
                                          .sha = require(vm, "sha"),
                                          .env = require(vm, "env"),
                                          .profile = profile.id,
                                          .path = require(vm, "path")};
  if (vm.contains("disclosure-hash")) {
    frame.disclosure_hash = vm["disclosure-hash"].as<std::string>();
  }
  return frame;
}

hap::crypto::signing_context load_context(const po::variables_map& vm) {
  if (vm.contains("private-key")) {
    auto context = hap::crypto::signing_context::from_private_key_hex(
        vm["private-key"].as<std::string>(), vm["key-id"].as<std::string>());
    if (!context) {
      hap::common::critical("--private-key is not a 32-byte hex seed");
    }
    return std::move(*context);
  }
  return hap::crypto::shared_signing_context();
}

hap::crypto::key_registry load_keys(const po::variables_map& vm) {
  auto keys = hap::crypto::key_registry{};
  if (vm.contains("public-key")) {
    if (!keys.add_hex(vm["key-id"].as<std::string>(),
                      vm["public-key"].as<std::string>())) {
      hap::common::critical("--public-key is not a 32-byte hex key");
    }
    return keys;
  }
  keys.add(load_context(vm));
  return keys;
}

int run_keygen(const po::variables_map& vm) {
  auto context =
      hap::crypto::signing_context::generate(vm["key-id"].as<std::string>());
  std::cout << "kid=" << context.kid() << '\n'
            << "private_key=" << context.private_key_hex() << '\n'
            << "public_key=" << context.public_key_hex() << '\n';
  return 0;
}

int run_pubkey(const po::variables_map& vm) {
  auto context = load_context(vm);
  std::cout << "kid=" << context.kid() << '\n'
            << "public_key=" << context.public_key_hex() << '\n';
  return 0;
}

int run_frame(const po::variables_map& vm) {
  const auto& profile = selected_profile(vm);
  auto fields = hap::frame::make_frame_fields(make_frame(vm, profile));
  auto canonical = hap::frame::canonical_frame(fields, profile);
  if (!canonical) {
    return report(canonical.error());
  }
  if (vm.contains("canonical")) {
    std::cout << canonical.value() << '\n';
  }
  std::cout << "frame_hash=" << hap::frame::frame_hash(canonical.value())
            << '\n';
  return 0;
}

int run_disclosure(const po::variables_map& vm) {
  const auto& profile = selected_profile(vm);
  if (profile.protocol == protocol_version_t::v0_2) {
    auto disclosure = disclosure_v02_t{.repo = require(vm, "repo"),
                                       .sha = require(vm, "sha"),
                                       .changed_paths = many(vm, "changed-path"),
                                       .risk_flags = many(vm, "risk-flag")};
    auto hash = hap::disclosure::disclosure_hash(disclosure, profile);
    if (!hash) {
      return report(hash.error());
    }
    std::cout << "disclosure_hash=" << hash.value() << '\n';
    return 0;
  }

  auto decision_file = hap::disclosure::parse_decision_file(
      read_file(require(vm, "decision-file")));
  if (!decision_file) {
    return report(decision_file.error());
  }
  auto hashes =
      hap::disclosure::domain_disclosure_hashes(decision_file.value(), profile);
  if (!hashes) {
    return report(hashes.error());
  }
  for (const auto& [domain, hash] : hashes.value()) {
    std::cout << domain << '=' << hash << '\n';
  }
  return 0;
}

int run_attest(const po::variables_map& vm) {
  const auto& profile = selected_profile(vm);
  const auto frame = make_frame(vm, profile);
  auto frame_hash = hap::frame::compute_frame_hash(
      hap::frame::make_frame_fields(frame), profile);
  if (!frame_hash) {
    return report(frame_hash.error());
  }

  const auto domain = require(vm, "domain");
  const auto did = require(vm, "did");
  auto ttl = std::optional<duration_seconds_t>{};
  if (vm.contains("ttl")) {
    ttl = vm["ttl"].as<int64_t>();
  }

  auto request = hap::attestation::sign_request_t{};
  if (profile.protocol == protocol_version_t::v0_2) {
    auto gates = many(vm, "gate");
    if (gates.empty()) {
      gates = profile.required_gates;
    }
    request = hap::attestation::sign_request<2>{
        .profile_id = profile.id,
        .execution_path = frame.path,
        .frame_hash = frame_hash.value(),
        .resolved_gates = std::move(gates),
        .decision_owners = {did},
        .decision_owner_scopes = {decision_owner_scope_t{
            .did = did, .domain = domain, .env = frame.env}},
        .ttl = ttl};
  } else {
    auto decision_file = hap::disclosure::parse_decision_file(
        read_file(require(vm, "decision-file")));
    if (!decision_file) {
      return report(decision_file.error());
    }
    auto it = decision_file.value().disclosure.find(domain);
    if (it == std::end(decision_file.value().disclosure)) {
      return report(make_error(error_code::validation_error,
                               "decision file does not disclose " + domain, {},
                               "hap_tool"));
    }
    auto disclosure_hash =
        hap::disclosure::domain_disclosure_hash(domain, it->second, profile);
    if (!disclosure_hash) {
      return report(disclosure_hash.error());
    }
    request = hap::attestation::sign_request<3>{
        .profile_id = profile.id,
        .execution_path = frame.path,
        .frame_hash = frame_hash.value(),
        .resolved_domains = {resolved_domain_t{
            .domain = domain,
            .did = did,
            .env = frame.env,
            .disclosure_hash = disclosure_hash.value()}},
        .ttl = ttl};
  }

  auto context = load_context(vm);
  auto issued = hap::attestation::sign(request, context, now_seconds(vm));
  if (!issued) {
    return report(issued.error());
  }
  auto block = hap::attestation::make_block(
      issued.value().attestation, issued.value().blob, frame, domain);
  if (!block) {
    return report(block.error());
  }
  auto text = hap::attestation::format_block(block.value());
  if (!text) {
    return report(text.error());
  }
  std::cout << text.value() << '\n';
  return 0;
}

int run_verify(const po::variables_map& vm) {
  const auto& profile = selected_profile(vm);
  auto fields = hap::frame::make_frame_fields(make_frame(vm, profile));
  const auto blobs = many(vm, "blob");
  if (blobs.size() != 1) {
    hap::common::critical("verify takes exactly one --blob");
  }
  auto keys = load_keys(vm);
  auto verified =
      hap::attestation::verify(blobs.front(), fields, keys, now_seconds(vm));
  if (!verified) {
    return report(verified.error());
  }
  const auto summary = summarize(verified.value().attestation.payload);
  std::cout << "valid attestation_id=" << verified.value().attestation_id
            << " profile=" << summary.profile_id
            << " expires_at=" << summary.expires_at << '\n';
  return 0;
}

int run_authorize(const po::variables_map& vm) {
  const auto& profile = selected_profile(vm);
  auto keys = load_keys(vm);
  auto executor = hap::execution::authorizer{keys};
  auto request = hap::execution::authorization_request_t{
      .blobs = many(vm, "blob"),
      .frame = hap::frame::make_frame_fields(make_frame(vm, profile)),
      .expected_profile_id = profile.id};
  auto authorization = executor.authorize(request, now_seconds(vm));
  if (!authorization) {
    return report(authorization.error());
  }

  const auto& value = authorization.value();
  auto scopes = nlohmann::ordered_json::array();
  for (const auto& scope : value.scopes) {
    scopes.push_back(nlohmann::ordered_json{
        {"domain", scope.domain}, {"did", scope.did}, {"env", scope.env}});
  }
  auto document =
      nlohmann::ordered_json{{"attestation_ids", value.attestation_ids},
                             {"frame_hash", value.frame_hash},
                             {"profile_id", value.profile_id},
                             {"execution_path", value.execution_path},
                             {"scopes", std::move(scopes)},
                             {"valid_from", value.valid_from},
                             {"valid_until", value.valid_until}};
  std::cout << document.dump() << '\n';
  return 0;
}

hap::sdg::review_context_t parse_review_context(const std::string& text) {
  const auto j = nlohmann::ordered_json::parse(text);
  auto strings = [&](const char* key) {
    return j.value(key, std::vector<std::string>{});
  };
  return hap::sdg::review_context_t{
      .affected_domains = strings("affected_domains"),
      .declared_decision_owner_scopes =
          strings("declared_decision_owner_scopes"),
      .frame_hashes = strings("frame_hashes"),
      .tradeoff_mode = j.value("tradeoff_mode", std::string{}),
      .execution_path = j.value("execution_path", std::string{}),
      .decision_file_present = j.value("decision_file_present", true),
      .required_domains = strings("required_domains"),
      .disclosed_domains = strings("disclosed_domains"),
      .objective_text = j.value("objective_text", std::string{}),
      .diff_summary = j.value("diff_summary", std::string{})};
}

hap::schema::result<hap::sdg::evaluation_t> evaluate_context(
    const po::variables_map& vm,
    const hap::sdg::review_context_t& context) {
  if (!vm.contains("definitions")) {
    return hap::sdg::evaluate_profile_set(selected_profile(vm), context);
  }
  auto definitions =
      hap::sdg::load_definitions(read_file(vm["definitions"].as<std::string>()));
  if (!definitions) {
    return definitions.error();
  }
  return hap::sdg::evaluate(definitions.value(), context);
}

int run_sdg(const po::variables_map& vm) {
  auto context = hap::sdg::review_context_t{};
  try {
    context = parse_review_context(read_file(require(vm, "context")));
  } catch (const nlohmann::ordered_json::exception& ex) {
    return report(make_error(error_code::validation_error,
                             std::string{"invalid review context: "} + ex.what(),
                             {}, "hap_tool"));
  }

  auto evaluation = evaluate_context(vm, context);
  if (!evaluation) {
    return report(evaluation.error());
  }

  for (const auto& outcome : evaluation.value().results) {
    if (!outcome.triggered) {
      continue;
    }
    std::cout << (outcome.stop_trigger ? "STOP " : "WARN ") << outcome.id
              << ": " << outcome.user_prompt.value_or("") << '\n';
  }
  return evaluation.value().has_hard_stop() ? kExitHardStop : 0;
}

// Maps HAP_SP_* environment variables onto their command line options.
std::string environment_option(const std::string& variable) {
  if (variable == hap::crypto::kPrivateKeyEnv) {
    return "private-key";
  }
  if (variable == hap::crypto::kKeyIdEnv) {
    return "key-id";
  }
  return {};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  hap_tool keygen [--key-id ID]\n"
            << "  hap_tool pubkey\n"
            << "  hap_tool frame --repo R --sha S --env E --path P\n"
            << "  hap_tool disclosure --decision-file FILE\n"
            << "  hap_tool attest --domain D --did DID [frame options]\n"
            << "  hap_tool verify --blob B [frame options]\n"
            << "  hap_tool authorize --blob B... [frame options]\n"
            << "  hap_tool sdg --context FILE [--definitions FILE]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"hap_tool options"};
  options.add_options()("help,h", "show help")("verbose,v",
                                               "enable debug logging")(
      "command", po::value<std::string>(&command),
      "keygen|pubkey|frame|disclosure|attest|verify|authorize|sdg")(
      "profile",
      po::value<std::string>()->default_value(
          std::string{hap::profile::kDeployGateV03}),
      "profile id")("repo", po::value<std::string>(), "repository slug")(
      "sha", po::value<std::string>(), "commit sha")(
      "env", po::value<std::string>()->default_value("prod"),
      "deployment environment")("path", po::value<std::string>(),
                                "execution path id")(
      "disclosure-hash", po::value<std::string>(),
      "v0.2 disclosure hash bound by the Frame")(
      "canonical", "also print the canonical Frame")(
      "changed-path", po::value<std::vector<std::string>>()->multitoken(),
      "v0.2 changed paths")("risk-flag",
                            po::value<std::vector<std::string>>()->multitoken(),
                            "v0.2 risk flags")(
      "decision-file", po::value<std::string>(), "v0.3 decision file")(
      "domain", po::value<std::string>(), "attesting domain (v0.2 role)")(
      "did", po::value<std::string>(), "decision owner identifier")(
      "gate", po::value<std::vector<std::string>>()->multitoken(),
      "v0.2 resolved gates, all profile gates when omitted")(
      "ttl", po::value<int64_t>(), "attestation lifetime in seconds")(
      "blob", po::value<std::vector<std::string>>()->multitoken(),
      "attestation blob(s)")("now", po::value<int64_t>(),
                              "override current Unix time")(
      "private-key", po::value<std::string>(),
      "signing key seed hex (HAP_SP_PRIVATE_KEY)")(
      "key-id",
      po::value<std::string>()->default_value(
          std::string{hap::crypto::kDefaultKeyId}),
      "signing key id (HAP_SP_KEY_ID)")("public-key", po::value<std::string>(),
                                        "verification public key hex")(
      "context", po::value<std::string>(), "SDG review context JSON")(
      "definitions", po::value<std::string>(), "SDG definitions JSON");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::store(po::parse_environment(options, environment_option), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    print_help(options);
    return kExitRejected;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  init_logging(vm.contains("verbose"));

  auto status = kExitRejected;
  if (command == "keygen") {
    status = run_keygen(vm);
  } else if (command == "pubkey") {
    status = run_pubkey(vm);
  } else if (command == "frame") {
    status = run_frame(vm);
  } else if (command == "disclosure") {
    status = run_disclosure(vm);
  } else if (command == "attest") {
    status = run_attest(vm);
  } else if (command == "verify") {
    status = run_verify(vm);
  } else if (command == "authorize") {
    status = run_authorize(vm);
  } else if (command == "sdg") {
    status = run_sdg(vm);
  } else {
    hap::common::critical(
        "command must be "
        "keygen|pubkey|frame|disclosure|attest|verify|authorize|sdg");
  }

  spdlog::shutdown();
  return status;
}
