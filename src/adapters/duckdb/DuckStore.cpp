#include "adapters/duckdb/DuckStore.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

std::string quoteSqlLiteral(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (const char ch : value) {
        if (ch == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string normalizeSeparators(std::string path) {
    for (auto& ch : path) {
        if (ch == '\\') {
            ch = '/';
        }
    }
    return path;
}

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" + path.parent_path().string()
                                     + "': " + ec.message());
        }
    }

    database_ = std::make_unique<::duckdb::DuckDB>(path.string());
    connection_ = std::make_unique<::duckdb::Connection>(*database_);
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    static constexpr auto kCreateCandlesTable = R"SQL(
        CREATE TABLE IF NOT EXISTS candles (
            timestamp TIMESTAMP,
            open DOUBLE,
            high DOUBLE,
            low DOUBLE,
            close DOUBLE,
            volume DOUBLE
        )
    )SQL";

    auto result = connection_->Query(kCreateCandlesTable);
    if (!result || result->HasError()) {
        const std::string errorMessage =
            result ? result->GetError() : std::string("unknown error creating candles table");
        throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
    }

    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

std::size_t DuckStore::rowCount() {
    auto result = connection_->Query("SELECT COUNT(*) FROM candles");
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"failed to count candles"};
        throw std::runtime_error("DuckStore: count failed: " + errorMessage);
    }

    std::int64_t count = 0;
    if (auto chunk = result->Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                count = value.GetValue<std::int64_t>();
            }
        }
    }
    return static_cast<std::size_t>(count);
}

std::size_t DuckStore::importCsv(const std::string& csvPath) {
    std::error_code ec;
    if (!fs::is_regular_file(csvPath, ec)) {
        throw std::runtime_error("DuckStore: CSV file not found: " + csvPath);
    }

    const auto before = rowCount();
    const std::string sql =
        "COPY candles FROM " + quoteSqlLiteral(normalizeSeparators(csvPath)) + " (HEADER, AUTO_DETECT TRUE)";

    auto result = connection_->Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown COPY error"};
        throw std::runtime_error("DuckStore: CSV import failed for " + csvPath + ": " + errorMessage);
    }

    const auto after = rowCount();
    const auto added = after >= before ? after - before : 0;
    LOG_INFO("DuckStore imported " << added << " candles from " << csvPath);
    return added;
}

std::size_t DuckStore::importCsvIfEmpty(const std::string& csvPath) {
    const auto existing = rowCount();
    if (existing > 0) {
        LOG_INFO("DuckStore: " << existing << " candles already stored, skipping CSV import");
        return 0;
    }

    std::error_code ec;
    if (!fs::is_regular_file(csvPath, ec)) {
        LOG_WARN("DuckStore: CSV " << csvPath << " not found; candles table stays empty");
        return 0;
    }

    return importCsv(csvPath);
}

}  // namespace adapters::duckdb
