#pragma once

#include "../core/error.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../util/numeric.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <fstream>
#include <functional>
#include <istream>
#include <sstream>
#include <string>

namespace aistrack::io {

    // ─── AIS CSV columns ─────────────────────────────────────────────────────────
    enum class Column : u8 {
        Mmsi,
        BaseDateTime,
        Lat,
        Lon,
        Sog,
        Cog,
        Heading,
        Detail, // one of the NonCriticalField columns
        TransceiverClass,
        Ignored,
    };

    struct ColumnBinding {
        Column column = Column::Ignored;
        NonCriticalField detail = NonCriticalField::VesselName;
    };

    inline ColumnBinding bind_column(const std::string &name) {
        if (name == "MMSI")
            return {Column::Mmsi};
        if (name == "BaseDateTime")
            return {Column::BaseDateTime};
        if (name == "LAT")
            return {Column::Lat};
        if (name == "LON")
            return {Column::Lon};
        if (name == "SOG")
            return {Column::Sog};
        if (name == "COG")
            return {Column::Cog};
        if (name == "Heading")
            return {Column::Heading};
        if (name == "TransceiverClass")
            return {Column::TransceiverClass};
        for (auto f : ALL_NON_CRITICAL_FIELDS) {
            if (name == column_name(f))
                return {Column::Detail, f};
        }
        return {Column::Ignored};
    }

    using ChunkHandler = std::function<Result<void>(const dp::Vector<RawPositionRecord> &, const BatchSchema &)>;

    namespace detail {

        // Splits one CSV record. Returns false while a quoted field is still open,
        // so the caller can append the next physical line.
        inline bool split_record(const std::string &line, dp::Vector<dp::Optional<std::string>> &fields) {
            fields.clear();
            std::string current;
            bool quoted = false;
            bool was_quoted = false;
            for (usize i = 0; i < line.size(); ++i) {
                char c = line[i];
                if (quoted) {
                    if (c == '"') {
                        if (i + 1 < line.size() && line[i + 1] == '"') {
                            current += '"';
                            ++i;
                        } else {
                            quoted = false;
                        }
                    } else {
                        current += c;
                    }
                } else if (c == '"') {
                    quoted = true;
                    was_quoted = true;
                } else if (c == ',') {
                    if (current.empty() && !was_quoted)
                        fields.push_back(dp::nullopt);
                    else
                        fields.push_back(current);
                    current.clear();
                    was_quoted = false;
                } else {
                    current += c;
                }
            }
            if (quoted)
                return false;
            if (current.empty() && !was_quoted)
                fields.push_back(dp::nullopt);
            else
                fields.push_back(current);
            return true;
        }

        inline void assign(RawPositionRecord &rec, const ColumnBinding &b, const dp::Optional<std::string> &v) {
            OptText text;
            if (v.has_value())
                text = dp::String(*v);
            switch (b.column) {
            case Column::Mmsi:
                rec.mmsi = text;
                break;
            case Column::BaseDateTime:
                rec.base_datetime = text;
                break;
            case Column::Lat:
                rec.lat = text;
                break;
            case Column::Lon:
                rec.lon = text;
                break;
            case Column::Sog:
                rec.sog = text;
                break;
            case Column::Cog:
                rec.cog = text;
                break;
            case Column::Heading:
                rec.heading = text;
                break;
            case Column::Detail:
                rec.details.field(b.detail) = text;
                break;
            case Column::TransceiverClass:
                rec.transceiver_class = text;
                break;
            case Column::Ignored:
                break;
            }
        }

        inline std::string quote(const dp::String &text) {
            std::string s = text.c_str();
            if (s.find_first_of(",\"\n\r") == std::string::npos)
                return s;
            std::string out = "\"";
            for (char c : s) {
                if (c == '"')
                    out += '"';
                out += c;
            }
            out += '"';
            return out;
        }

        inline std::string cell(const OptText &v) { return v.has_value() ? quote(*v) : std::string(); }

    } // namespace detail

    // ─── Streaming reader ────────────────────────────────────────────────────────
    // The first record is the header. Empty cells are null, unknown columns are
    // ignored, and the batch schema lists the descriptive columns the header
    // names. Rows are delivered in chunks of `chunk_size`; a handler error stops
    // the read and is returned. Yields the number of data rows read.
    inline Result<usize> read_raw_csv(std::istream &in, usize chunk_size, const ChunkHandler &on_chunk) {
        if (chunk_size == 0)
            return Result<usize>::err(Error::invalid_argument("chunk_size must be at least 1"));

        dp::Vector<dp::Optional<std::string>> fields;
        std::string line;
        std::string record;

        auto next_record = [&]() -> bool {
            record.clear();
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (record.empty() && line.empty())
                    continue;
                if (!record.empty())
                    record += '\n';
                record += line;
                if (detail::split_record(record, fields))
                    return true;
            }
            return false;
        };

        if (!next_record())
            return Result<usize>::err(Error::parse_error("CSV input has no header row"));

        dp::Vector<ColumnBinding> bindings;
        BatchSchema schema;
        bool has_mmsi = false;
        for (const auto &f : fields) {
            ColumnBinding b = bind_column(f.has_value() ? *f : std::string());
            if (b.column == Column::Detail)
                schema.add(b.detail);
            if (b.column == Column::Mmsi)
                has_mmsi = true;
            bindings.push_back(b);
        }
        if (!has_mmsi)
            return Result<usize>::err(Error::parse_error("CSV header lacks the MMSI column"));

        dp::Vector<RawPositionRecord> chunk;
        chunk.reserve(chunk_size < 4096 ? chunk_size : 4096);
        usize total = 0;

        auto flush = [&]() -> Result<void> {
            if (chunk.empty())
                return {};
            auto r = on_chunk(chunk, schema);
            chunk.clear();
            return r;
        };

        while (next_record()) {
            RawPositionRecord rec;
            for (usize i = 0; i < bindings.size() && i < fields.size(); ++i)
                detail::assign(rec, bindings[i], fields[i]);
            chunk.push_back(std::move(rec));
            ++total;
            if (chunk.size() >= chunk_size) {
                auto r = flush();
                if (!r.is_ok())
                    return Result<usize>::err(r.error());
                echo::category("aistrack.io.csv").debug("delivered chunk, total rows: ", total);
            }
        }
        if (!record.empty())
            echo::category("aistrack.io.csv").warn("unterminated quoted field at end of input, record skipped");

        auto r = flush();
        if (!r.is_ok())
            return Result<usize>::err(r.error());
        return Result<usize>::ok(total);
    }

    inline Result<usize> read_raw_csv(const dp::String &path, usize chunk_size, const ChunkHandler &on_chunk) {
        std::ifstream in(path.c_str());
        if (!in) {
            echo::category("aistrack.io.csv").error("cannot open ", path);
            return Result<usize>::err(Error::io_error("cannot open CSV file: " + path));
        }
        auto r = read_raw_csv(in, chunk_size, on_chunk);
        if (r.is_ok())
            echo::category("aistrack.io.csv").info("read ", r.value(), " rows from ", path);
        return r;
    }

    // Whole-input convenience for small batches
    struct RawBatch {
        dp::Vector<RawPositionRecord> rows;
        BatchSchema schema;
    };

    inline Result<RawBatch> parse_raw_csv(const dp::String &text) {
        std::istringstream in(text.c_str());
        RawBatch batch;
        auto r = read_raw_csv(in, static_cast<usize>(-1), [&batch](const auto &rows, const BatchSchema &schema) {
            batch.rows = rows;
            batch.schema = schema;
            return Result<void>{};
        });
        if (!r.is_ok())
            return Result<RawBatch>::err(r.error());
        return Result<RawBatch>::ok(std::move(batch));
    }

    // ─── Cleaned CSV writer ──────────────────────────────────────────────────────
    inline void write_cleaned_csv(std::ostream &out, const dp::Vector<CleanedPositionRecord> &records) {
        out << "MMSI,BaseDateTime,LAT,LON,SOG,COG,Heading";
        for (auto f : ALL_NON_CRITICAL_FIELDS)
            out << ',' << column_name(f);
        out << ",TransceiverClass,flag_reason\n";

        for (const auto &rec : records) {
            out << rec.mmsi.c_str() << ',' << rec.timestamp.to_iso8601().c_str() << ','
                << util::format_f64(rec.lat).c_str() << ',' << util::format_f64(rec.lon).c_str() << ','
                << detail::cell(util::format_f64(rec.sog)) << ',' << detail::cell(util::format_f64(rec.cog)) << ','
                << detail::cell(util::format_f64(rec.heading));
            for (auto f : ALL_NON_CRITICAL_FIELDS)
                out << ',' << detail::cell(rec.details.field(f));
            out << ',' << detail::cell(rec.transceiver_class) << ',' << detail::quote(rec.flags.to_string()) << '\n';
        }
    }

    inline Result<usize> write_cleaned_csv(const dp::String &path, const dp::Vector<CleanedPositionRecord> &records) {
        std::ofstream out(path.c_str());
        if (!out)
            return Result<usize>::err(Error::io_error("cannot create CSV file: " + path));
        write_cleaned_csv(out, records);
        out.flush();
        if (!out)
            return Result<usize>::err(Error::io_error("write failed: " + path));
        echo::category("aistrack.io.csv").info("wrote ", records.size(), " cleaned rows to ", path);
        return Result<usize>::ok(records.size());
    }

} // namespace aistrack::io
