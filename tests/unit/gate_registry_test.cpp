#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/gate/gate_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using provgate::gate::GateRegistry;
using provgate::gate::MakeGate;
using namespace provgate::v1;

std::shared_ptr<const provgate::gate::Gate> Passing(const std::string& name) {
  return MakeGate(name, [](const provgate::gate::GateContext&) {
    GateVerdict verdict;
    verdict.set_status(GATE_STATUS_PASS);
    return verdict;
  });
}

void TestRegistrationOrderIsKept() {
  GateRegistry registry;
  registry.Register(STAGE_DATASET, Passing("c"));
  registry.Register(STAGE_DATASET, Passing("a"));
  registry.Register(STAGE_DATASET, Passing("b"));
  registry.Register(STAGE_MODEL, Passing("a"));

  const auto gates = registry.GatesFor(STAGE_DATASET);
  assert(gates.size() == 3);
  assert(gates[0]->Name() == "c");
  assert(gates[1]->Name() == "a");
  assert(gates[2]->Name() == "b");
  assert(registry.GatesFor(STAGE_MODEL).size() == 1);
  assert(registry.GatesFor(STAGE_TRAINING).empty());
}

void TestDuplicateAndInvalidRegistration() {
  GateRegistry registry;
  registry.Register(STAGE_DATASET, Passing("bias"));

  bool threw = false;
  try {
    registry.Register(STAGE_DATASET, Passing("bias"));
  } catch (const provgate::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register(STAGE_DATASET, nullptr);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register(STAGE_UNSPECIFIED, Passing("x"));
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestUnregisterAndFind() {
  GateRegistry registry;
  registry.Register(STAGE_DATASET, Passing("bias"));
  registry.Register(STAGE_DATASET, Passing("quality"));

  assert(registry.Contains(STAGE_DATASET, "bias"));
  assert(!registry.Contains(STAGE_MODEL, "bias"));
  assert(registry.Find(STAGE_DATASET, "quality")->Name() == "quality");

  assert(registry.Unregister(STAGE_DATASET, "bias"));
  assert(!registry.Unregister(STAGE_DATASET, "bias"));
  assert(!registry.Unregister(STAGE_MODEL, "bias"));
  assert(registry.Find(STAGE_DATASET, "bias") == nullptr);
  assert(registry.GatesFor(STAGE_DATASET).size() == 1);

  // a removed name can be registered again, now last
  registry.Register(STAGE_DATASET, Passing("bias"));
  assert(registry.GatesFor(STAGE_DATASET).back()->Name() == "bias");
}

void TestSnapshotSurvivesLaterRegistration() {
  GateRegistry registry;
  registry.Register(STAGE_DATASET, Passing("a"));
  const auto snapshot = registry.GatesFor(STAGE_DATASET);

  registry.Register(STAGE_DATASET, Passing("b"));
  registry.Unregister(STAGE_DATASET, "a");
  assert(snapshot.size() == 1);
  assert(snapshot[0]->Name() == "a");
}

void TestConcurrentRegistration() {
  GateRegistry             registry;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&registry, t] {
      for (int i = 0; i < 25; ++i) {
        registry.Register(STAGE_TRAINING, Passing("gate-" + std::to_string(t) + "-" + std::to_string(i)));
        registry.GatesFor(STAGE_TRAINING);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(registry.GatesFor(STAGE_TRAINING).size() == 100);
}

void TestEvidenceDigestIgnoresOrder() {
  provgate::gate::OperationContext a;
  a.evidence = {{"s3://bucket/a", "aa", "text/csv"}, {"s3://bucket/b", "bb", "text/csv"}};
  provgate::gate::OperationContext b;
  b.evidence = {{"s3://bucket/b", "bb", "text/csv"}, {"s3://bucket/a", "aa", "text/csv"}};
  provgate::gate::OperationContext c;
  c.evidence = {{"s3://bucket/a", "ab", "text/csv"}, {"s3://bucket/b", "bb", "text/csv"}};

  assert(a.EvidenceDigest() == b.EvidenceDigest());
  assert(a.EvidenceDigest() != c.EvidenceDigest());
  assert(a.EvidenceDigest().size() == 64);
}

} // namespace

int main() {
  TestRegistrationOrderIsKept();
  TestDuplicateAndInvalidRegistration();
  TestUnregisterAndFind();
  TestSnapshotSurvivesLaterRegistration();
  TestConcurrentRegistration();
  TestEvidenceDigestIgnoresOrder();

  std::cout << "provgate_unit_gate_registry: pass\n";
  return 0;
}
