#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/anchor/anchor_chain.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/audit/batch_ticker.hpp"
#include "internal/audit/proof_bundle.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_audit_log.hpp"
#include "internal/db/sqlite/sqlite_audit_log.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/util/errors.hpp"

namespace {

using provgate::audit::AuditTrail;
using provgate::audit::ReceiptQuery;
using provgate::crypto::Ed25519Key;
using provgate::merkle::BatchWindow;
using provgate::merkle::MerkleBatcher;
using provgate::merkle::RootSigning;
using namespace provgate::v1;
using namespace std::chrono_literals;

std::shared_ptr<provgate::trust::TrustLayer> Operators(int count) {
  auto trust = std::make_shared<provgate::trust::TrustLayer>();
  for (int i = 0; i < count; ++i) {
    trust->RegisterEntity("operator-" + std::to_string(i), SIGNER_ROLE_PLATFORM_OPERATOR, Ed25519Key::Generate(), provgate::util::TimePoint{});
  }
  return trust;
}

RootSigning Signing(uint32_t threshold) {
  RootSigning signing;
  signing.threshold             = threshold;
  signing.retry.max_attempts    = 1;
  signing.retry.initial_backoff = 1ms;
  return signing;
}

// Memory log whose batch writes can be switched off.
class BatchWriteFailingLog final : public provgate::db::AuditLog {
 public:
  std::atomic<bool> fail_batches{false};

  std::unique_ptr<provgate::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  provgate::db::Result AppendReceipt(provgate::db::Transaction& tx, provgate::db::model::ReceiptRecord& record) override {
    return inner_.AppendReceipt(tx, record);
  }
  std::optional<provgate::db::model::ReceiptRecord> GetReceipt(provgate::db::Transaction& tx, const std::string& receipt_id) override {
    return inner_.GetReceipt(tx, receipt_id);
  }
  std::vector<provgate::db::model::ReceiptRecord> ReadReceipts(provgate::db::Transaction& tx, const provgate::db::model::ReceiptFilter& filter,
                                                               uint64_t start_offset, uint64_t max_entries) override {
    return inner_.ReadReceipts(tx, filter, start_offset, max_entries);
  }
  provgate::db::Result AppendBatch(provgate::db::Transaction& tx, provgate::db::model::BatchRow& row) override {
    if (fail_batches) {
      return provgate::db::Result::Err(provgate::db::ErrorCode::IOError, "disk full");
    }
    return inner_.AppendBatch(tx, row);
  }
  std::vector<provgate::db::model::BatchRow> ReadBatches(provgate::db::Transaction& tx) override {
    return inner_.ReadBatches(tx);
  }

  std::size_t BatchCount() {
    auto tx   = inner_.Begin();
    auto rows = inner_.ReadBatches(*tx);
    tx->Commit();
    return rows.size();
  }

 private:
  provgate::db::memory::MemoryAuditLog inner_;
};

struct Harness {
  std::shared_ptr<provgate::trust::TrustLayer> trust;
  std::shared_ptr<provgate::db::AuditLog>      log;
  std::shared_ptr<AuditTrail>                  trail;
  provgate::receipt::ReceiptGenerator          generator;
  provgate::anchor::AnchorChain                chain{"lifecycle-1", "0123456789abcdef0123456789abcdef"};

  Harness(std::shared_ptr<provgate::trust::TrustLayer> t, std::shared_ptr<provgate::db::AuditLog> l, BatchWindow window,
          uint32_t threshold = 1)
      : trust(std::move(t)),
        log(std::move(l)),
        trail(std::make_shared<AuditTrail>(log, std::make_shared<MerkleBatcher>(trust, window, Signing(threshold)), trust)),
        generator(trust, SIGNER_ROLE_PLATFORM_OPERATOR) {
  }

  Receipt Seal(const std::string& operation_id, Stage stage) {
    const auto anchor = chain.Derive(stage, "salt");
    GateVerdict verdict;
    verdict.set_gate_name("quality");
    verdict.set_stage(stage);
    verdict.set_status(GATE_STATUS_PASS);
    return generator.Seal(operation_id, anchor, provgate::crypto::Sha256Hex(operation_id), {verdict});
  }
};

void TestAppendIsIdempotent() {
  Harness h(Operators(1), std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{100, 1h});

  const auto receipt = h.Seal("op-1", STAGE_DATASET);
  assert(h.trail->Append(receipt));
  assert(!h.trail->Append(receipt));

  ReceiptQuery query;
  query.operation_id = "op-1";
  auto cursor        = h.trail->Query(query);
  assert(cursor.Next().has_value());
  assert(!cursor.Next().has_value());

  // a single leaf was queued
  auto batch = h.trail->SealPending();
  assert(batch);
  assert(batch->Record().leaf_count() == 1);
  assert(h.trail->SealPending() == nullptr);
}

void TestTamperedReceiptIsRejected() {
  Harness h(Operators(1), std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{100, 1h});

  auto receipt = h.Seal("op-1", STAGE_DATASET);
  receipt.set_reason("edited after sealing");

  bool threw = false;
  try {
    h.trail->Append(receipt);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!h.trail->GetReceipt(receipt.receipt_id()).has_value());
}

void TestQueryFiltersAndCursorRestarts() {
  Harness h(Operators(1), std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{100, 1h});

  const auto first = h.Seal("op-1", STAGE_DATASET);
  h.trail->Append(first);
  h.trail->Append(h.Seal("op-2", STAGE_DATASET));
  const auto model = h.Seal("op-1", STAGE_MODEL);
  h.trail->Append(model);

  ReceiptQuery by_operation;
  by_operation.operation_id = "op-1";
  auto cursor               = h.trail->Query(by_operation, 1);
  assert(cursor.Next()->receipt_id() == first.receipt_id());

  // appended while the cursor is open
  const auto late = h.Seal("op-1", STAGE_MODEL);
  h.trail->Append(late);

  assert(cursor.Next()->receipt_id() == model.receipt_id());
  assert(cursor.Next()->receipt_id() == late.receipt_id());
  assert(!cursor.Next().has_value());

  cursor.Reset();
  assert(cursor.Next()->receipt_id() == first.receipt_id());

  ReceiptQuery by_stage;
  by_stage.stage = STAGE_MODEL;
  auto staged    = h.trail->Query(by_stage);
  std::size_t n  = 0;
  while (staged.Next()) ++n;
  assert(n == 2);

  ReceiptQuery window;
  window.from = provgate::util::FromProto(model.issued_at());
  window.to   = provgate::util::FromProto(late.issued_at());
  auto timed  = h.trail->Query(window);
  assert(timed.Next()->receipt_id() == model.receipt_id());
  assert(timed.Next()->receipt_id() == late.receipt_id());
  assert(!timed.Next().has_value());
}

void TestExportedBundlesVerifyOffline() {
  Harness h(Operators(3), std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{2, 1h}, 2);

  std::vector<Receipt> receipts;
  for (int i = 0; i < 5; ++i) {
    receipts.push_back(h.Seal(i % 2 == 0 ? "op-1" : "op-2", STAGE_DATASET));
    h.trail->Append(receipts.back());
  }

  // the fifth receipt is still open; export seals it
  const auto bundles = h.trail->ExportProofBundle("op-1");
  assert(bundles.size() == 3);
  for (std::size_t i = 0; i < bundles.size(); ++i) {
    assert(bundles[i].receipt().receipt_id() == receipts[i * 2].receipt_id());
    assert(bundles[i].threshold() == 2);
    assert(bundles[i].root_signatures_size() >= 2);
    assert(provgate::audit::VerifyProofBundle(bundles[i]).valid);
  }

  // JSON keeps everything a verifier needs
  const auto json   = provgate::audit::ToJson(bundles[1]);
  const auto parsed = provgate::audit::ProofBundleFromJson(json);
  assert(provgate::audit::VerifyProofBundle(parsed).valid);

  auto altered = bundles[0];
  altered.mutable_receipt()->set_reason("approved");
  assert(!provgate::audit::VerifyProofBundle(altered).valid);

  altered = bundles[0];
  altered.mutable_proof()->mutable_steps(0)->mutable_sibling()->front() ^= 0x01;
  assert(provgate::audit::VerifyProofBundle(altered).reason == "inclusion proof does not recompute the batch root");

  altered = bundles[0];
  altered.mutable_root_signatures()->RemoveLast();
  altered.mutable_root_signatures()->RemoveLast();
  assert(!provgate::audit::VerifyProofBundle(altered).valid);

  altered = bundles[0];
  altered.clear_signer_keys();
  bool threw = false;
  try {
    provgate::audit::CheckProofBundle(altered);
  } catch (const provgate::util::ProofVerificationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.trail->ExportProofBundle("op-unknown");
  } catch (const provgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    provgate::audit::ProofBundleFromJson("{not json");
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSigningOutageDefersSealing() {
  auto    trust = Operators(1);
  Harness h(trust, std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{1, 1h});

  const auto receipt = h.Seal("op-1", STAGE_DATASET);
  trust->SetAvailable("operator-0", false);
  // the receipt itself was signed before the outage; only the batch waits
  assert(h.trail->Append(receipt));
  assert(h.trail->GetReceipt(receipt.receipt_id()).has_value());

  trust->SetAvailable("operator-0", true);
  auto batch = h.trail->SealIfDue();
  assert(batch);
  assert(batch->Record().leaves(0) == receipt.digest());
}

void TestBatchWriteFailureKeepsReceiptAndRetries() {
  auto    log = std::make_shared<BatchWriteFailingLog>();
  Harness h(Operators(1), log, BatchWindow{1, 1h});

  log->fail_batches  = true;
  const auto dataset = h.Seal("op-1", STAGE_DATASET);
  assert(h.trail->Append(dataset));
  assert(h.trail->GetReceipt(dataset.receipt_id()).has_value());
  assert(h.trail->UnpersistedBatches() == 1);
  assert(log->BatchCount() == 0);
  // the batch is sealed in memory, so a proof is already available
  assert(provgate::audit::VerifyProofBundle(h.trail->BundleFor(dataset)).valid);

  log->fail_batches = false;
  const auto model  = h.Seal("op-1", STAGE_MODEL);
  assert(h.trail->Append(model));
  assert(h.trail->UnpersistedBatches() == 0);
  assert(log->BatchCount() == 2);

  auto tx   = log->Begin();
  auto rows = log->ReadBatches(*tx);
  tx->Commit();
  BatchRecord first;
  assert(first.ParseFromString(rows[0].payload));
  assert(first.leaves(0) == dataset.digest());
}

void TestHydrateRestoresBatchesAndPending() {
  const auto path  = (std::filesystem::temp_directory_path() / "provgate_audit_trail_hydrate.db").string();
  auto       clean = [&] {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
  };
  clean();

  auto trust = Operators(1);
  auto open  = [&] {
    return std::make_shared<provgate::db::sqlite::SqliteAuditLog>(std::make_shared<provgate::db::sqlite::SqliteDB>(path));
  };

  Receipt sealed;
  Receipt pending;
  {
    Harness h(trust, open(), BatchWindow{100, 1h});
    sealed = h.Seal("op-1", STAGE_DATASET);
    h.trail->Append(sealed);
    assert(h.trail->SealPending());
    pending = h.Seal("op-1", STAGE_MODEL);
    h.trail->Append(pending);
  }

  Harness restarted(trust, open(), BatchWindow{100, 1h});
  restarted.trail->Hydrate();

  // the persisted batch proves the first receipt without resealing
  const auto bundle = restarted.trail->BundleFor(sealed);
  assert(provgate::audit::VerifyProofBundle(bundle).valid);

  bool threw = false;
  try {
    restarted.trail->BundleFor(pending);
  } catch (const provgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto batch = restarted.trail->SealPending();
  assert(batch);
  assert(batch->Record().leaf_count() == 1);
  assert(batch->Record().leaves(0) == pending.digest());

  const auto bundles = restarted.trail->ExportProofBundle("op-1");
  assert(bundles.size() == 2);
  assert(bundles[0].batch_id() != bundles[1].batch_id());

  clean();
}

void TestTickerSealsAgedBatch() {
  Harness h(Operators(1), std::make_shared<provgate::db::memory::MemoryAuditLog>(), BatchWindow{100, 20ms});
  const auto receipt = h.Seal("op-1", STAGE_DATASET);
  h.trail->Append(receipt);

  provgate::audit::BatchTicker ticker(h.trail, 10ms);
  ticker.Start();

  bool sealed = false;
  for (int i = 0; i < 200 && !sealed; ++i) {
    std::this_thread::sleep_for(10ms);
    try {
      sealed = provgate::audit::VerifyProofBundle(h.trail->BundleFor(receipt)).valid;
    } catch (const provgate::util::NotFound&) {
      sealed = false;
    }
  }
  ticker.Stop();
  assert(sealed);
}

} // namespace

int main() {
  TestAppendIsIdempotent();
  TestTamperedReceiptIsRejected();
  TestQueryFiltersAndCursorRestarts();
  TestExportedBundlesVerifyOffline();
  TestSigningOutageDefersSealing();
  TestBatchWriteFailureKeepsReceiptAndRetries();
  TestHydrateRestoresBatchesAndPending();
  TestTickerSealsAgedBatch();

  std::cout << "provgate_unit_audit_trail: pass\n";
  return 0;
}
