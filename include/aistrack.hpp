#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "aistrack/core/config.hpp"
#include "aistrack/core/constants.hpp"
#include "aistrack/core/error.hpp"
#include "aistrack/core/flags.hpp"
#include "aistrack/core/mmsi.hpp"
#include "aistrack/core/record.hpp"
#include "aistrack/core/timestamp.hpp"
#include "aistrack/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "aistrack/util/bitfield.hpp"
#include "aistrack/util/event.hpp"
#include "aistrack/util/numeric.hpp"

// ─── Geodesy ─────────────────────────────────────────────────────────────────
#include "aistrack/geo/haversine.hpp"

// ─── Ingestion-time validation ──────────────────────────────────────────────
#include "aistrack/validate/normalize.hpp"
#include "aistrack/validate/validator.hpp"

// ─── Trajectories ────────────────────────────────────────────────────────────
#include "aistrack/track/anomaly.hpp"
#include "aistrack/track/metrics.hpp"
#include "aistrack/track/sanitizer.hpp"
#include "aistrack/track/vessel_track.hpp"

// ─── Encoding / rendering ────────────────────────────────────────────────────
#include "aistrack/encode/feature.hpp"
#include "aistrack/encode/map_view.hpp"

// ─── I/O and services ────────────────────────────────────────────────────────
#include "aistrack/io/csv.hpp"
#include "aistrack/service/ingest_service.hpp"
#include "aistrack/service/track_service.hpp"
