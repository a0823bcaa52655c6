#pragma once

#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../io/csv.hpp"
#include "../util/event.hpp"
#include "../validate/validator.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace aistrack::service {

    // Durable store for cleaned batches. Implemented by the persistence layer.
    class RecordSink {
      public:
        virtual ~RecordSink() = default;
        virtual Result<void> store(const dp::Vector<CleanedPositionRecord> &cleaned, usize dropped_count) = 0;
    };

    // ─── Ingestion-time service ──────────────────────────────────────────────────
    // validate -> store -> notify. A sink failure is returned to the caller and
    // reported on on_batch_failed; bad rows never fail a batch.
    class IngestService {
        PipelineConfig config_;
        RecordSink &sink_;

      public:
        IngestService(PipelineConfig config, RecordSink &sink) : config_(std::move(config)), sink_(sink) {}

        Result<validate::ValidationReport> ingest(const dp::Vector<RawPositionRecord> &rows,
                                                  const BatchSchema &schema = BatchSchema::all()) {
            auto result = validate::validate_batch(rows, schema);
            auto stored = sink_.store(result.cleaned, result.dropped_count);
            if (!stored.is_ok()) {
                echo::category("aistrack.service.ingest").error("sink rejected batch: ", stored.error().message);
                on_batch_failed.emit(stored.error());
                return Result<validate::ValidationReport>::err(stored.error());
            }

            echo::category("aistrack.service.ingest")
                .info("batch stored: kept=", result.cleaned.size(), " dropped=", result.dropped_count);
            on_batch_validated.emit(result.report);
            return Result<validate::ValidationReport>::ok(result.report);
        }

        // Streams the file in csv_chunk_size batches; totals span all chunks.
        // Duplicate detection stays within each chunk.
        Result<validate::ValidationReport> ingest_csv(const dp::String &path) {
            auto valid = validate_pipeline_config(config_);
            if (!valid.is_ok()) {
                on_batch_failed.emit(valid.error());
                return Result<validate::ValidationReport>::err(valid.error());
            }

            validate::ValidationReport total;
            bool sink_failed = false;
            auto read = io::read_raw_csv(path, config_.csv_chunk_size,
                                         [this, &total, &sink_failed](const dp::Vector<RawPositionRecord> &rows,
                                                        const BatchSchema &schema) -> Result<void> {
                                             auto r = ingest(rows, schema);
                                             if (!r.is_ok()) {
                                                 sink_failed = true;
                                                 return Result<void>::err(r.error());
                                             }
                                             accumulate(total, r.value());
                                             return {};
                                         });
            if (!read.is_ok()) {
                if (!sink_failed)
                    on_batch_failed.emit(read.error());
                return Result<validate::ValidationReport>::err(read.error());
            }
            return Result<validate::ValidationReport>::ok(total);
        }

        Event<const validate::ValidationReport &> on_batch_validated;
        Event<const Error &> on_batch_failed;

      private:
        static void accumulate(validate::ValidationReport &into, const validate::ValidationReport &r) {
            into.input_rows += r.input_rows;
            into.malformed += r.malformed;
            into.invalid_identity += r.invalid_identity;
            into.invalid_geodata += r.invalid_geodata;
            into.exact_duplicates += r.exact_duplicates;
            into.zero_position += r.zero_position;
            into.missing_non_critical += r.missing_non_critical;
            into.same_time_duplicate += r.same_time_duplicate;
        }
    };

} // namespace aistrack::service
