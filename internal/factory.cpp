#include "factory.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_audit_log.hpp"
#include "internal/db/sqlite/sqlite_audit_log.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/policy/policy_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace provgate::factory {

using provgate::observability::IntField;
using provgate::observability::StringField;
using provgate::runtime::config::RuntimeConfig;

namespace {

constexpr std::size_t kAnchorSecretBytes = 32;

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InvalidArgument("cannot read " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

std::shared_ptr<db::AuditLog> BuildAuditLog(const RuntimeConfig& config) {
  const auto& audit = config.audit();
  if (audit.has_sqlite()) {
    if (audit.sqlite().path().empty()) {
      throw util::InvalidArgument("audit.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(audit.sqlite().path());
    PROVGATE_LOG_INFO("Audit log backend", {StringField("backend", "sqlite"), StringField("path", audit.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteAuditLog>(std::move(sqlite_db));
  }

  PROVGATE_LOG_WARN("Audit log backend is in-memory; receipts are lost on exit", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryAuditLog>();
}

std::shared_ptr<trust::TrustLayer> BuildTrust(const RuntimeConfig& config) {
  auto trust = std::make_shared<trust::TrustLayer>();

  for (const auto& entity : config.entities()) {
    if (entity.private_key_path().empty()) {
      throw util::InvalidArgument("entity " + entity.id() + " has no private_key_path");
    }

    auto key = crypto::Ed25519Key::FromPrivatePemFile(entity.private_key_path());

    const auto valid_from = entity.valid_from().empty() ? util::TimePoint{} : util::ParseUtc(entity.valid_from());
    std::optional<util::TimePoint> valid_until;
    if (!entity.valid_until().empty()) {
      valid_until = util::ParseUtc(entity.valid_until());
    }

    const auto key_id = trust->RegisterEntity(entity.id(), entity.role(), std::move(key), valid_from, valid_until);
    PROVGATE_LOG_INFO("Signing entity registered", {StringField("entity_id", entity.id()), StringField("key_id", key_id),
                                                    StringField("role", provgate::v1::SignerRole_Name(entity.role()))});
  }
  return trust;
}

std::string LoadAnchorSecret(const RuntimeConfig& config) {
  if (config.anchor_secret_path().empty()) {
    PROVGATE_LOG_WARN("No anchor_secret_path configured; using an ephemeral anchor secret");
    return crypto::RandomBytes(kAnchorSecretBytes);
  }

  auto secret = ReadFile(config.anchor_secret_path());
  if (secret.size() < kAnchorSecretBytes) {
    throw util::InvalidArgument("anchor secret must be at least " + std::to_string(kAnchorSecretBytes) + " bytes");
  }
  return secret;
}

util::BackoffPolicy SigningBackoff(const RuntimeConfig& config) {
  util::BackoffPolicy retry;
  if (config.signing().max_attempts() > 0) {
    retry.max_attempts = config.signing().max_attempts();
  }
  retry.initial_backoff = util::ToMillis(config.signing().initial_backoff(), retry.initial_backoff);
  retry.max_backoff     = util::ToMillis(config.signing().max_backoff(), retry.max_backoff);
  return retry;
}

provgate::v1::SignerRole RoleOr(provgate::v1::SignerRole role, provgate::v1::SignerRole fallback) {
  return role == provgate::v1::SIGNER_ROLE_UNSPECIFIED ? fallback : role;
}

} // namespace

std::shared_ptr<anchor::AnchorChain> Runtime::OpenLifecycle(const std::string& lifecycle_id) const {
  std::lock_guard lock(lifecycles->mutex);
  auto& chain = lifecycles->chains[lifecycle_id];
  if (!chain) {
    chain = std::make_shared<anchor::AnchorChain>(lifecycle_id, anchor_secret);
    PROVGATE_LOG_DEBUG("Lifecycle opened", {StringField("lifecycle_id", lifecycle_id)});
  }
  return chain;
}

service::ServiceContext Runtime::Services() const {
  service::ServiceContext ctx;
  ctx.audit   = audit;
  ctx.reviews = reviews;
  ctx.trust   = trust;
  return ctx;
}

void Runtime::Shutdown() {
  if (batch_ticker) {
    batch_ticker->Stop();
  }
  if (workers) {
    workers->Stop();
  }
  if (audit) {
    try {
      if (auto batch = audit->SealPending()) {
        PROVGATE_LOG_INFO("Final batch sealed", {StringField("batch_id", batch->Id())});
      }
    } catch (const std::exception& e) {
      PROVGATE_LOG_ERROR("Final batch could not be sealed; receipts stay unbatched in the log", {StringField("error", e.what())});
    }
  }
}

/*
    Build full application dependency graph
*/
Runtime Build(const RuntimeConfig& config, const provgate::v1::Policy& policy) {
  Runtime app;

  // ------------------------------------------------------------------
  // Trust and storage
  // ------------------------------------------------------------------
  app.trust         = BuildTrust(config);
  app.audit_log     = BuildAuditLog(config);
  app.anchor_secret = LoadAnchorSecret(config);

  const auto retry = SigningBackoff(config);

  // ------------------------------------------------------------------
  // Merkle batching and audit trail
  // ------------------------------------------------------------------
  merkle::BatchWindow window;
  if (config.batching().max_receipts() > 0) {
    window.max_receipts = config.batching().max_receipts();
  }
  window.max_age = util::ToMillis(config.batching().max_age(), window.max_age);

  merkle::RootSigning root_signing;
  root_signing.role  = RoleOr(config.signing().root_role(), provgate::v1::SIGNER_ROLE_PLATFORM_OPERATOR);
  root_signing.retry = retry;
  if (config.signing().root_threshold() > 0) {
    root_signing.threshold = config.signing().root_threshold();
  }

  app.batcher = std::make_shared<merkle::MerkleBatcher>(app.trust, window, root_signing);
  app.audit   = std::make_shared<audit::AuditTrail>(app.audit_log, app.batcher, app.trust);
  app.audit->Hydrate();

  app.batch_ticker = std::make_shared<audit::BatchTicker>(app.audit, std::clamp(window.max_age / 4, std::chrono::milliseconds(100),
                                                                                 std::chrono::milliseconds(5000)));
  app.batch_ticker->Start();

  // ------------------------------------------------------------------
  // Gates, policy and orchestration
  // ------------------------------------------------------------------
  app.registry = std::make_shared<gate::GateRegistry>();
  app.reviews  = std::make_shared<orchestrator::ReviewBroker>();

  // registration is checked per run; gates are plugged in after startup
  auto engine = std::make_shared<const policy::PolicyEngine>(policy);

  app.receipts = std::make_shared<receipt::ReceiptGenerator>(
      app.trust, RoleOr(config.signing().receipt_role(), provgate::v1::SIGNER_ROLE_PLATFORM_OPERATOR));

  std::size_t threads = config.orchestrator().worker_threads();
  if (threads == 0) {
    threads = std::max(2u, std::thread::hardware_concurrency());
  }
  app.scheduler = std::make_shared<orchestrator::EvaluationScheduler>();
  app.workers   = std::make_shared<orchestrator::EvaluationWorkers>(app.scheduler, threads);
  app.workers->Start();

  orchestrator::OrchestratorOptions options;
  options.gate_timeout       = util::ToMillis(config.orchestrator().gate_timeout(), options.gate_timeout);
  options.escalation_timeout = util::ToMillis(config.orchestrator().escalation_timeout(), options.escalation_timeout);
  options.sealing_retry      = retry;

  app.orchestrator = std::make_shared<orchestrator::GateOrchestrator>(app.registry, engine, app.receipts, app.audit, app.reviews,
                                                                      app.scheduler, options);

  PROVGATE_LOG_INFO("Runtime built", {StringField("policy_id", engine->Ref().id), StringField("policy_version", engine->Ref().version),
                                      IntField("entities", config.entities_size()), IntField("workers", static_cast<int64_t>(threads))});
  return app;
}

} // namespace provgate::factory
