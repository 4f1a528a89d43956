#pragma once

// Core types
#include "core/config.hpp"
#include "core/types.hpp"

// Wire protocol
#include "protocol/methods.hpp"
#include "protocol/session_update.hpp"
#include "protocol/wire_message.hpp"

// Live reconstruction
#include "conversation/turn_builder.hpp"

// Persisted logs
#include "replay/log_replayer.hpp"
#include "replay/pending_permissions.hpp"
#include "replay/stored_log.hpp"

// Working-tree snapshots
#include "snapshot/snapshot_applier.hpp"
#include "snapshot/tree_snapshot.hpp"

// Resume
#include "resume/http_run_source.hpp"
#include "resume/resume_orchestrator.hpp"
#include "resume/run_source.hpp"

namespace acp {

// Initialize logging from `config`
void init(const Config& config);

// Get version string
std::string version();

}  // namespace acp
