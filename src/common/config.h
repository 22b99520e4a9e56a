#ifndef SLUICE_COMMON_CONFIG_H_
#define SLUICE_COMMON_CONFIG_H_

#include <cstdint>
#include <cstddef>

/// Dispatcher defaults
/// Number of worker threads pulling from the work queue
const int DEFAULT_WORKER_COUNT = 4;
/// Bound on requests waiting in the work queue
const size_t DEFAULT_QUEUE_CAPACITY = 100;
/// Bound on admitted requests (queued + processing)
const size_t DEFAULT_ADMISSION_LIMIT = 3;
/// Deadline applied when the caller gives none. 0 disables the default deadline.
const int64_t DEFAULT_PER_REQUEST_TIMEOUT_MS = 5000;
/// Time allowed for draining admitted work at shutdown before aborting it
const int64_t DEFAULT_SHUTDOWN_GRACE_PERIOD_MS = 2000;
/// How long an enqueue waits on a full work queue. 0 rejects immediately.
const int64_t DEFAULT_ENQUEUE_TIMEOUT_MS = 0;
/// Capacity of the statistics event stream
const size_t DEFAULT_STATS_QUEUE_CAPACITY = 4096;
/// A processor still running this long after its deadline is logged as ignoring cancellation
const int64_t LATE_CANCELLATION_WARNING_MS = 100;

/// Synthetic workload defaults
const int DEFAULT_NUM_REQUESTS = 20;
const int64_t DEFAULT_ARRIVAL_INTERVAL_MS = 50;
const int64_t DEFAULT_BASE_COST_MS = 100;
const int64_t DEFAULT_COST_STEP_MS = 50;
const int DEFAULT_COST_BUCKETS = 5;
/// Every request whose id is a multiple of this fails. 0 disables faults.
const int DEFAULT_FAILURE_MODULUS = 7;
const int64_t DEFAULT_RESPONSE_TIMEOUT_MS = 10000;
const int64_t DEFAULT_MONITOR_INTERVAL_MS = 2000;
/// Number of distinct request paths the generator cycles through
const int NUM_ENDPOINTS = 5;

#endif // SLUICE_COMMON_CONFIG_H_
