#pragma once
#include <hap/schema/primitives.hpp>

#include <map>
#include <string>
#include <variant>
#include <vector>

// Schema type: disclosure.
// What a reviewer was shown. Only ever hashed; the protocol never interprets
// the text.
namespace hap::schema {

struct domain_rationale_t final {
  std::string problem;
  std::string objective;
  std::string tradeoffs;
};

// deploy-gate@0.2 aggregate disclosure.
struct disclosure_v02_t final {
  std::string repo;
  std::string sha;
  std::vector<std::string> changed_paths;
  std::vector<std::string> risk_flags;
  std::map<std::string, domain_rationale_t> domains;
};

// deploy-gate@0.3 per-domain structured fields.
using disclosure_value_t = std::variant<std::string, std::vector<std::string>>;
using domain_disclosure_t = std::map<std::string, disclosure_value_t>;

// Developer-authored decision file shipped with the commit.
struct decision_file_t final {
  std::string profile;
  std::string execution_path;
  std::map<std::string, domain_disclosure_t> disclosure;
};

}  // namespace hap::schema
