#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "duckdb.hpp"

#include "adapters/duckdb/DuckCandleRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "core/Timestamp.hpp"

namespace {

namespace fs = std::filesystem;

constexpr char kCsv[] =
    "timestamp,open,high,low,close,volume\n"
    "2024-02-01 00:00:00,100.0,105.0,99.0,104.0,1200\n"
    "2024-02-03 00:00:00,104.0,108.5,103.0,107.0,900\n"
    "2024-02-02 00:00:00,104.0,106.0,101.5,102.0,1500\n"
    "2024-02-04 00:00:00,107.0,109.0,104.0,108.0,700\n";

struct TempDir {
    TempDir() : path(fs::temp_directory_path() / "ohlcv_test_duck_repo") {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

std::int64_t ts(const char* text) {
    const auto parsed = core::parseTimestamp(text);
    if (!parsed) {
        throw std::runtime_error(std::string("bad fixture timestamp ") + text);
    }
    return *parsed;
}

}  // namespace

int main() {
    try {
        TempDir dir;
        const auto csvPath = (dir.path / "stocks.csv").string();
        const auto dbPath = (dir.path / "db" / "data.duckdb").string();
        {
            std::ofstream csv(csvPath);
            csv << kCsv;
        }

        {
            adapters::duckdb::DuckStore store(dbPath);
            store.migrate();
            store.migrate();  // idempotent

            if (store.importCsvIfEmpty((dir.path / "missing.csv").string()) != 0) {
                std::cerr << "Expected a missing CSV to be skipped\n";
                return 1;
            }
            if (store.importCsvIfEmpty(csvPath) != 4) {
                std::cerr << "Expected 4 rows imported into an empty table\n";
                return 1;
            }
            if (store.importCsvIfEmpty(csvPath) != 0 || store.rowCount() != 4) {
                std::cerr << "Expected a populated table to skip the CSV\n";
                return 1;
            }

            bool missingThrew = false;
            try {
                store.importCsv((dir.path / "missing.csv").string());
            } catch (const std::runtime_error&) {
                missingThrew = true;
            }
            if (!missingThrew) {
                std::cerr << "Expected importCsv to throw on a missing file\n";
                return 1;
            }
        }

        {
            // A row with a NULL close, read back as NaN.
            duckdb::DuckDB db(dbPath);
            duckdb::Connection con(db);
            auto res = con.Query("INSERT INTO candles VALUES ('2024-02-05 00:00:00', 108.0, 110.0, 107.0, NULL, 300)");
            if (!res || res->HasError()) {
                std::cerr << "Insert error: " << (res ? res->GetError() : std::string{}) << "\n";
                return 1;
            }
        }

        {
            adapters::duckdb::DuckCandleRepo repo(dbPath);
            if (repo.count() != 5) {
                std::cerr << "Expected 5 rows, got " << repo.count() << "\n";
                return 1;
            }

            const auto firstTwo = repo.getCandles(2);
            if (firstTwo.size() != 2 || firstTwo[0].ts != ts("2024-02-01") || firstTwo[1].ts != ts("2024-02-02")) {
                std::cerr << "Expected the first two candles ordered by timestamp\n";
                return 1;
            }
            if (firstTwo[1].c != 102.0 || firstTwo[1].v != 1500.0 || firstTwo[1].l != 101.5) {
                std::cerr << "Unexpected column mapping for 2024-02-02\n";
                return 1;
            }

            const auto series = repo.getSeries(std::nullopt);
            if (series.size() != 5) {
                std::cerr << "Expected the full series, got " << series.size() << "\n";
                return 1;
            }
            for (std::size_t i = 1; i < series.size(); ++i) {
                if (series[i].ts <= series[i - 1].ts) {
                    std::cerr << "Series is not strictly ordered at " << i << "\n";
                    return 1;
                }
            }
            if (!std::isnan(series.back().c)) {
                std::cerr << "Expected a NULL close to be read as NaN\n";
                return 1;
            }

            const domain::contracts::TimeRange range{ts("2024-02-02"), ts("2024-02-03")};
            const auto ranged = repo.getSeries(range);
            if (ranged.size() != 2 || ranged.front().ts != range.fromMs || ranged.back().ts != range.toMs) {
                std::cerr << "Expected inclusive range bounds\n";
                return 1;
            }

            const auto priceRange = repo.getPriceRange(range);
            if (!priceRange || priceRange->low != 101.5 || priceRange->high != 108.5) {
                std::cerr << "Unexpected price range over the selection\n";
                return 1;
            }

            const auto allPrices = repo.getPriceRange(std::nullopt);
            if (!allPrices || allPrices->low != 99.0 || allPrices->high != 110.0) {
                std::cerr << "Unexpected price range over the full table\n";
                return 1;
            }

            const domain::contracts::TimeRange before{ts("2023-01-01"), ts("2023-01-31")};
            if (repo.getPriceRange(before) || !repo.getSeries(before).empty()) {
                std::cerr << "Expected an empty selection before the data\n";
                return 1;
            }
        }

        {
            // Bad bounds: a NULL low on 02-06 and a NaN low on 02-08.
            duckdb::DuckDB db(dbPath);
            duckdb::Connection con(db);
            auto res = con.Query(
                "INSERT INTO candles VALUES "
                "('2024-02-06 00:00:00', 108.0, 111.0, NULL, 109.0, 300), "
                "('2024-02-08 00:00:00', 109.0, 112.0, 'NaN'::DOUBLE, 110.0, 300)");
            if (!res || res->HasError()) {
                std::cerr << "Insert error: " << (res ? res->GetError() : std::string{}) << "\n";
                return 1;
            }
        }

        adapters::duckdb::DuckCandleRepo repo(dbPath);
        const auto isNanRange = [](const std::optional<domain::contracts::PriceRange>& value) {
            return value && std::isnan(value->low) && std::isnan(value->high);
        };

        if (!isNanRange(repo.getPriceRange(domain::contracts::TimeRange{ts("2024-02-06"), ts("2024-02-06")}))) {
            std::cerr << "Expected a NULL low to make the price range NaN\n";
            return 1;
        }
        if (!isNanRange(repo.getPriceRange(domain::contracts::TimeRange{ts("2024-02-08"), ts("2024-02-08")}))) {
            std::cerr << "Expected a NaN low to make the price range NaN\n";
            return 1;
        }
        if (!isNanRange(repo.getPriceRange(std::nullopt))) {
            std::cerr << "Expected bad rows to poison the full-table price range\n";
            return 1;
        }

        const auto clean = repo.getPriceRange(domain::contracts::TimeRange{ts("2024-02-01"), ts("2024-02-04")});
        if (!clean || clean->low != 99.0 || clean->high != 109.0) {
            std::cerr << "Expected a selection without bad rows to stay finite\n";
            return 1;
        }

        const auto withNullLow = repo.getSeries(domain::contracts::TimeRange{ts("2024-02-06"), ts("2024-02-06")});
        if (withNullLow.size() != 1 || !std::isnan(withNullLow.front().l)) {
            std::cerr << "Expected a NULL low to be read as NaN\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
