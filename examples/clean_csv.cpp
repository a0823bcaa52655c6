#include <aistrack.hpp>
#include <echo/echo.hpp>

using namespace aistrack;

// Validates an AIS CSV export chunk by chunk and writes the cleaned rows.
//   clean_csv <raw.csv> <cleaned.csv>
int main(int argc, char *argv[]) {
    if (argc < 3) {
        echo::error("usage: ", argv[0], " <raw.csv> <cleaned.csv>");
        return 1;
    }

    auto config = PipelineConfig::from_env();
    if (!config.is_ok()) {
        echo::error("configuration: ", config.error().message);
        return 1;
    }
    if (auto valid = validate_pipeline_config(config.value()); !valid.is_ok()) {
        echo::error("configuration: ", valid.error().message);
        return 1;
    }

    dp::Vector<CleanedPositionRecord> cleaned;
    validate::ValidationReport totals;

    auto read = io::read_raw_csv(dp::String(argv[1]), config.value().csv_chunk_size,
                                 [&](const dp::Vector<RawPositionRecord> &rows, const BatchSchema &schema) {
                                     auto result = validate::validate_batch(rows, schema);
                                     totals.input_rows += result.report.input_rows;
                                     totals.malformed += result.report.malformed;
                                     totals.invalid_identity += result.report.invalid_identity;
                                     totals.invalid_geodata += result.report.invalid_geodata;
                                     totals.exact_duplicates += result.report.exact_duplicates;
                                     for (auto &rec : result.cleaned)
                                         cleaned.push_back(std::move(rec));
                                     echo::info("chunk: ", rows.size(), " rows, dropped ", result.dropped_count);
                                     return Result<void>{};
                                 });
    if (!read.is_ok()) {
        echo::error("read failed: ", read.error().message);
        return 1;
    }

    auto written = io::write_cleaned_csv(dp::String(argv[2]), cleaned);
    if (!written.is_ok()) {
        echo::error("write failed: ", written.error().message);
        return 1;
    }

    echo::info("Rows read:        ", totals.input_rows);
    echo::info("Rows loaded:      ", cleaned.size());
    echo::info("Rows dropped:     ", totals.dropped());
    echo::info("  malformed:      ", totals.malformed);
    echo::info("  invalid MMSI:   ", totals.invalid_identity);
    echo::info("  invalid coords: ", totals.invalid_geodata);
    echo::info("  exact dupes:    ", totals.exact_duplicates);
    return 0;
}
