#pragma once

#include <cstdint>
#include <string>

namespace provgate::db::model {

// `payload` is the serialized provgate.core.v1.BatchRecord.
struct BatchRow {
  uint64_t    sequence = 0;
  std::string batch_id;
  int64_t     sealed_at_us = 0;
  std::string payload;
};

}
