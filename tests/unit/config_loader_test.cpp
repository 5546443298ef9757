#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using provgate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "provgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestRuntimeConfigLoads() {
  const auto yaml_path = WriteYaml("runtime",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
logging:
  level: debug
signing:
  max_attempts: 5
  initial_backoff: "0.05s"
  max_backoff: "2s"
  receipt_role: SIGNER_ROLE_PLATFORM_OPERATOR
  root_role: SIGNER_ROLE_AUDITOR
  root_threshold: 2
batching:
  max_receipts: 64
  max_age: "30s"
orchestrator:
  worker_threads: 8
  gate_timeout: "10s"
  escalation_timeout: "3600s"
audit:
  sqlite:
    path: "/var/lib/provgate/audit.db"
entities:
  - id: operator-1
    role: SIGNER_ROLE_PLATFORM_OPERATOR
    private_key_path: "/etc/provgate/keys/operator-1.pem"
    valid_from: "2026-01-01T00:00:00Z"
  - id: auditor-1
    role: SIGNER_ROLE_AUDITOR
    private_key_path: "/etc/provgate/keys/auditor-1.pem"
policy_path: "/etc/provgate/policy.yaml"
anchor_secret_path: "/etc/provgate/anchor.key"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.logging().level() == "debug");
  assert(config.signing().max_attempts() == 5);
  assert(config.signing().initial_backoff().nanos() == 50000000);
  assert(config.signing().root_role() == provgate::core::v1::SIGNER_ROLE_AUDITOR);
  assert(config.signing().root_threshold() == 2);
  assert(config.batching().max_age().seconds() == 30);
  assert(config.orchestrator().escalation_timeout().seconds() == 3600);
  assert(config.audit().has_sqlite());
  assert(config.audit().sqlite().path() == "/var/lib/provgate/audit.db");
  assert(config.entities_size() == 2);
  assert(config.entities(1).role() == provgate::core::v1::SIGNER_ROLE_AUDITOR);
  assert(config.entities(1).valid_from().empty());
  assert(config.anchor_secret_path() == "/etc/provgate/anchor.key");
}

void TestPolicyLoadsWithQuotedVersion() {
  const auto yaml_path = WriteYaml("policy",
                                   R"(policy_id: credit-scoring
version: "2.0"
description: "baseline gates"
stages:
  - stage: STAGE_DATASET
    fail_fast: true
    on_warn: ENFORCEMENT_ACTION_WARN
    gates:
      - gate_name: bias
        enabled: true
        thresholds:
          max_disparity: 0.1
          min_coverage: 0.95
      - gate_name: pii
        enabled: false
  - stage: STAGE_MODEL
    parallel_execution: true
    gates:
      - gate_name: robustness
        enabled: true
        enforcement_action: ENFORCEMENT_ACTION_ESCALATE
)");

  const auto policy = ConfigLoader::LoadPolicyFromYaml(yaml_path.string());
  assert(policy.policy_id() == "credit-scoring");
  assert(policy.version() == "2.0");
  assert(policy.stages_size() == 2);

  const auto& dataset = policy.stages(0);
  assert(dataset.stage() == provgate::core::v1::STAGE_DATASET);
  assert(dataset.fail_fast());
  assert(dataset.gates_size() == 2);
  assert(dataset.gates(0).thresholds().at("max_disparity") == 0.1);
  assert(dataset.gates(0).thresholds().at("min_coverage") == 0.95);
  assert(!dataset.gates(1).enabled());

  const auto& model = policy.stages(1);
  assert(model.parallel_execution());
  assert(model.gates(0).enforcement_action() == provgate::core::v1::ENFORCEMENT_ACTION_ESCALATE);
}

void TestScalarEscaping() {
  provgate::runtime::config::RuntimeConfig config;
  ConfigLoader::ParseYaml(R"(server:
  bind_address: "line1\nline2☃"
audit:
  sqlite:
    path: "C:\\provgate\\\"quoted\"\\audit.db"
)",
                          &config);

  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.audit().sqlite().path() == "C:\\provgate\\\"quoted\"\\audit.db");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(policy_id: baseline
version: "1"
stages:
  - stage: STAGE_DATASET
    gates:
      - gate_name: bias
        enabeld: true
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadPolicyFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnknownEnumAndMissingFileRejected() {
  provgate::policy::v1::Policy policy;
  bool                         threw = false;
  try {
    ConfigLoader::ParseYaml("stages:\n  - stage: STAGE_SHIPPING\n", &policy);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/provgate/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRuntimeConfigLoads();
  TestPolicyLoadsWithQuotedVersion();
  TestScalarEscaping();
  TestUnknownFieldsAreRejected();
  TestUnknownEnumAndMissingFileRejected();

  std::cout << "provgate_unit_config_loader: pass\n";
  return 0;
}
