#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace provgate::db::model {

/*
  One appended receipt. `payload` is the serialized provgate.core.v1.Receipt;
  the other columns are copies kept for filtering.
*/
struct ReceiptRecord {
  uint64_t    offset = 0;
  std::string receipt_id;
  std::string operation_id;
  int         stage = 0;
  int64_t     issued_at_us = 0;
  std::string digest;
  std::string payload;
};

// Empty fields match everything. Time bounds are inclusive.
struct ReceiptFilter {
  std::optional<std::string> operation_id;
  std::optional<int>         stage;
  std::optional<int64_t>     from_us;
  std::optional<int64_t>     to_us;

  bool Matches(const ReceiptRecord& r) const {
    if (operation_id && r.operation_id != *operation_id) return false;
    if (stage && r.stage != *stage) return false;
    if (from_us && r.issued_at_us < *from_us) return false;
    if (to_us && r.issued_at_us > *to_us) return false;
    return true;
  }
};

}
