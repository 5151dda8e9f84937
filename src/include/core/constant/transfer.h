#pragma once

#include <cstddef>
#include <cstdint>

namespace puresend::core {

namespace transfer {

// Bump together with a migration step in HistoryLedger
constexpr int kHistoryStorageVersion = 1;
constexpr std::size_t kDefaultMaxHistoryCount = 1000;

constexpr std::size_t kDefaultRecordCacheCapacity = 512;

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

} // namespace transfer

} // namespace puresend::core
