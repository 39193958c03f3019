#pragma once

/**
 * Stockledger inventory engine
 *
 * Main include file - includes all public engine headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"
#include "config.hpp"

// Reference data
#include "catalog.hpp"

// Ledger, projection and admission
#include "ledger_store.hpp"
#include "projector.hpp"
#include "validation.hpp"
#include "admission.hpp"
#include "checkpoint.hpp"

// Read side
#include "bundle_resolver.hpp"
#include "low_stock.hpp"

// Facade
#include "engine.hpp"
