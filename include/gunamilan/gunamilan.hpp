// =============================================================================
// gunamilan.hpp — Single-include convenience header for the match engine.
//
//   #include "gunamilan/gunamilan.hpp"   // everything
//
// Or pick what you need:
//
//   #include "gunamilan/koota.hpp"       // the eight scorers only
//   #include "gunamilan/match.hpp"       // compute_match
//   #include "gunamilan/batch.hpp"       // compute_batch (pulls in spdlog)
//   #include "gunamilan/report.hpp"      // writers (pulls in nlohmann::json)
// =============================================================================
#pragma once

// ── Core types & tables ─────────────────────────────────────────────────────
#include "types.hpp"
#include "domain_tables.hpp"
#include "names.hpp"
#include "concepts.hpp"

// ── Scoring ─────────────────────────────────────────────────────────────────
#include "koota.hpp"
#include "guna.hpp"
#include "manglik.hpp"
#include "dasha.hpp"
#include "spice.hpp"

// ── Orchestration ───────────────────────────────────────────────────────────
#include "match.hpp"
#include "batch.hpp"

// ── I/O ─────────────────────────────────────────────────────────────────────
#include "report.hpp"
#include "person_io.hpp"
