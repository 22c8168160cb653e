#pragma once

#include <hap/crypto/signing_context.hpp>
#include <hap/frame/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/schema/disclosure.hpp>
#include <hap/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace hap::testing {

inline constexpr auto kRepo = std::string_view{"acme/widgets"};
inline constexpr auto kSha =
    std::string_view{"0123456789abcdef0123456789abcdef01234567"};
inline constexpr auto kCanaryPath = std::string_view{"deploy-prod-canary"};
inline constexpr auto kFullPath = std::string_view{"deploy-prod-full"};
inline constexpr auto kNow = hap::schema::timestamp_seconds_t{1700000000};

// RFC 8032 section 7.1, test 1.
inline constexpr auto kRfc8032Seed = std::string_view{
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};
inline constexpr auto kRfc8032PublicKey = std::string_view{
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};

// Canonical v0.2 disclosure of make_disclosure_v02().
inline constexpr auto kDisclosureV02Hash = std::string_view{
    "sha256:f8f3ae49d8ca76ebd005133d581f1b402bf6284fd35d3ab342ad05bc11e64792"};

inline hap::crypto::signing_context make_signing_context(
    std::string kid = std::string{hap::crypto::kDefaultKeyId}) {
  auto context =
      hap::crypto::signing_context::from_private_key_hex(kRfc8032Seed, kid);
  if (!context) {
    return hap::crypto::signing_context::generate(std::move(kid));
  }
  return std::move(*context);
}

inline hap::frame::deploy_frame_t make_frame_v03(
    const std::string_view path = kCanaryPath) {
  return hap::frame::deploy_frame_t{
      .repo = std::string{kRepo},
      .sha = std::string{kSha},
      .env = "prod",
      .profile = std::string{hap::profile::kDeployGateV03},
      .path = std::string{path}};
}

inline hap::frame::deploy_frame_t make_frame_v02(
    const std::string_view path = kCanaryPath) {
  return hap::frame::deploy_frame_t{
      .repo = std::string{kRepo},
      .sha = std::string{kSha},
      .env = "prod",
      .profile = std::string{hap::profile::kDeployGateV02},
      .path = std::string{path},
      .disclosure_hash = std::string{kDisclosureV02Hash}};
}

inline hap::schema::disclosure_v02_t make_disclosure_v02() {
  return hap::schema::disclosure_v02_t{
      .repo = std::string{kRepo},
      .sha = std::string{kSha},
      .changed_paths = {"src/db/schema.sql", "./src/api//handler.cpp"},
      .risk_flags = {"public_api", "migration"}};
}

inline hap::schema::domain_disclosure_t make_engineering_disclosure() {
  return hap::schema::domain_disclosure_t{
      {"diff_summary", std::string{"Adds pagination to the list endpoint"}},
      {"changed_paths",
       std::vector<std::string>{"src/db/schema.sql", "src/api/handler.cpp"}},
      {"test_status", std::string{"All unit and integration tests pass"}},
      {"rollback_strategy", std::string{"Revert the commit and redeploy"}}};
}

inline hap::schema::domain_disclosure_t make_release_disclosure() {
  return hap::schema::domain_disclosure_t{
      {"deployment_window", std::string{"Tuesday 10:00 UTC"}},
      {"rollback_plan", std::string{"Roll back through the deploy pipeline"}},
      {"monitoring_dashboards", std::string{"https://grafana/d/api"}}};
}

inline hap::schema::domain_disclosure_t make_security_disclosure() {
  return hap::schema::domain_disclosure_t{
      {"affected_surfaces", std::vector<std::string>{"auth", "api"}},
      {"threat_category", std::string{"authentication"}},
      {"mitigation_path", std::string{"Token scopes are checked server side"}}};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline std::string write_temp_file(const std::string_view prefix,
                                   const std::string_view contents) {
  auto path = make_temp_path(prefix);
  auto out = std::ofstream{path, std::ios::binary};
  out << contents;
  return path;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace hap::testing
