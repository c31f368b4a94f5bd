#pragma once

/**
 * Lattice C++ Client Library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Data model and wire codec
#include "types.hpp"
#include "codec.hpp"
#include "events.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "validation.hpp"
#include "subjects.hpp"

// Transports
#include "transport.hpp"
#include "memory_bus.hpp"
#include "grpc_transport.hpp"

// Scatter-gather core
#include "cancellation.hpp"
#include "aggregator.hpp"
#include "collector.hpp"

// Query façade
#include "client.hpp"
#include "builder.hpp"
#include "watcher.hpp"
