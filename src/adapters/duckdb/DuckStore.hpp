#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Schema bootstrap and CSV bulk load. Opens its own database handle; close it
// (let it go out of scope) before opening a DuckCandleRepo on the same file.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/data.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    void migrate();

    // Appends every row of `csvPath` (header line, auto-detected types).
    // Returns the number of rows added. Throws when the file is missing or
    // DuckDB rejects it.
    std::size_t importCsv(const std::string& csvPath);

    // importCsv only when the candles table is empty. A missing file is logged
    // and skipped. Returns the number of rows added.
    std::size_t importCsvIfEmpty(const std::string& csvPath);

    std::size_t rowCount();

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
    std::unique_ptr<::duckdb::Connection> connection_;
};

}  // namespace adapters::duckdb
