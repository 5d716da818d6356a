#pragma once

// AgentHub: Coordination substrate for fleets of specialized agents
//
// Routes requests to agents, delivers messages between them with retries
// and workflows, and lets them mutate shared state under lease locks and
// two-phase commit.

// Core
#include "agenthub/types.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/config.hpp"
#include "agenthub/util.hpp"
#include "agenthub/monitor.hpp"
#include "agenthub/hub.hpp"

// State store
#include "agenthub/kv_store.hpp"
#include "agenthub/lock_manager.hpp"
#include "agenthub/transaction.hpp"
#include "agenthub/conflict.hpp"
#include "agenthub/state_entry.hpp"
#include "agenthub/state_manager.hpp"

// Messaging
#include "agenthub/message.hpp"
#include "agenthub/message_queue.hpp"
#include "agenthub/message_bus.hpp"
#include "agenthub/workflow.hpp"

// Routing
#include "agenthub/router.hpp"
