// This is the single entry point for the chatlink library.
// Include this file to get access to the core public API.

#pragma once

// Client facade and configuration
#include "chatlink/core/client.hpp"
#include "chatlink/core/config/client_options.hpp"

// Core data types and wire events
#include "chatlink/core/types.hpp"
#include "chatlink/core/protocol/events.hpp"
#include "chatlink/core/protocol/json_frame_codec.hpp"

// Connection session
#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/session/reconnect_policy.hpp"
#include "chatlink/core/session/heartbeat_driver.hpp"

// Chat rooms
#include "chatlink/core/chat/room_session.hpp"
#include "chatlink/core/chat/delivery_tracker.hpp"
#include "chatlink/core/chat/typing_debouncer.hpp"

// Credentials
#include "chatlink/core/auth/bearer_token.hpp"
#include "chatlink/core/store/file_token_store.hpp"
#include "chatlink/core/store/memory_token_store.hpp"

// Public interfaces for extension
#include "chatlink/core/interfaces/itransport.hpp"
#include "chatlink/core/interfaces/iframe_codec.hpp"
#include "chatlink/core/interfaces/IBackoffStrategy.hpp"
#include "chatlink/core/interfaces/ITokenStore.hpp"
#include "chatlink/core/interfaces/IHistorySource.hpp"
#include "chatlink/core/strategies/exponential_backoff.hpp"

// Utilities
#include "chatlink/core/util/logger.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/observable.hpp"
#include "chatlink/core/util/thread_pool.hpp"
#include "chatlink/core/util/time.hpp"

// Transports
#include "chatlink/transports/websocket/websocket_transport.hpp"
