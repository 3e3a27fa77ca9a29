#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>

#include "adapters/duckdb/DuckStore.hpp"

namespace {

namespace fs = std::filesystem;

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <csv> [db] [--if-empty]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string csvPath;
    std::string dbPath = "data/data.duckdb";
    bool onlyIfEmpty = false;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--if-empty") {
            onlyIfEmpty = true;
        }
        else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (positional == 0) {
            csvPath = arg;
            ++positional;
        }
        else if (positional == 1) {
            dbPath = arg;
            ++positional;
        }
        else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (csvPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (!fs::is_regular_file(csvPath, ec)) {
        std::cerr << "CSV file not found: " << csvPath << std::endl;
        return 1;
    }

    try {
        adapters::duckdb::DuckStore store(dbPath);
        store.migrate();

        const std::size_t before = store.rowCount();
        const std::size_t inserted = onlyIfEmpty ? store.importCsvIfEmpty(csvPath) : store.importCsv(csvPath);
        const std::size_t after = store.rowCount();

        std::cout << "Import summary:" << std::endl;
        std::cout << "  source: " << csvPath << std::endl;
        std::cout << "  database: " << dbPath << std::endl;
        std::cout << "  inserted: " << inserted << " rows (" << before << " -> " << after << ")" << std::endl;
        return 0;
    }
    catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
    }

    return 1;
}
