#include <aistrack.hpp>
#include <echo/echo.hpp>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace aistrack;

// Per-vessel quality report and anomaly list for an AIS CSV export.
//   vessel_report <raw.csv>
int main(int argc, char *argv[]) {
    if (argc < 2) {
        echo::error("usage: ", argv[0], " <raw.csv>");
        return 1;
    }

    auto batch = io::read_raw_csv(dp::String(argv[1]), DEFAULT_CSV_CHUNK_SIZE,
                                  [&](const dp::Vector<RawPositionRecord> &rows, const BatchSchema &schema) {
                                      auto result = validate::validate_batch(rows, schema);
                                      auto staged = validate::normalize_batch(result.cleaned);

                                      // Group per vessel, keeping file order
                                      dp::Map<dp::String, dp::Vector<CleanedPositionRecord>> by_vessel;
                                      for (const auto &rec : staged)
                                          by_vessel[rec.mmsi].push_back(rec);

                                      for (const auto &[mmsi, records] : by_vessel) {
                                          auto assessed = track::assess_track(records);
                                          usize kept = 0;
                                          f64 distance = 0.0;
                                          for (const auto &a : assessed) {
                                              if (a.retained())
                                                  ++kept;
                                              distance = a.cumulative_distance_km;
                                          }
                                          echo::info(mmsi, ": ", records.size(), " rows, ", kept,
                                                     " retained, ", distance, " km");
                                      }

                                      nlohmann::json events = nlohmann::json::array();
                                      for (const auto &a : track::detect_anomalies(staged))
                                          events.push_back(a.to_json());
                                      std::cout << events.dump(2) << std::endl;
                                      return Result<void>{};
                                  });
    if (!batch.is_ok()) {
        echo::error("read failed: ", batch.error().message);
        return 1;
    }
    echo::info("processed ", batch.value(), " rows");
    return 0;
}
