// ============================================================================
// offload/offload.hpp - Umbrella Header
// ============================================================================
//
// Runs heavy work in a separate worker process and hands the outcome back
// on the caller's own loop, without ever blocking it.
//
//   Host loop ──Submit──> TaskSupervisor ──spawn──> worker process
//       ^                     │    ^                    │
//       │                 Poller   └── request.json ────┘
//       │                     │        result.json <────┘
//       └──── on_done(Outcome) ┘
//
// ============================================================================

#pragma once

#include "offload/core/check.hpp"
#include "offload/core/defer.hpp"
#include "offload/core/error.hpp"
#include "offload/core/log.hpp"
#include "offload/core/result.hpp"
#include "offload/io/executor.hpp"
#include "offload/io/libuv_executor.hpp"
#include "offload/io/tick_executor.hpp"
#include "offload/process/worker_launcher.hpp"
#include "offload/protocol/handshake.hpp"
#include "offload/protocol/result_decoder.hpp"
#include "offload/supervisor/offloader.hpp"
#include "offload/supervisor/poller.hpp"
#include "offload/supervisor/task.hpp"
#include "offload/supervisor/task_supervisor.hpp"
