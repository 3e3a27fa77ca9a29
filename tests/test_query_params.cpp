#include <iostream>
#include <string>

#include "http/QueryParams.hpp"

int main() {
    using ohlcv::http::QueryString;
    using ohlcv::http::url_decode;

    if (url_decode("2024-02-01%2000%3A00%3A00", true) != "2024-02-01 00:00:00") {
        std::cerr << "Percent escapes were not decoded\n";
        return 1;
    }
    if (url_decode("a+b", true) != "a b" || url_decode("a+b", false) != "a+b") {
        std::cerr << "Unexpected '+' handling\n";
        return 1;
    }
    if (url_decode("100%", true) != "100%" || url_decode("%zz", true) != "%zz" || url_decode("%4", true) != "%4") {
        std::cerr << "Malformed escapes must pass through\n";
        return 1;
    }
    if (url_decode("%2f%2F", false) != "//") {
        std::cerr << "Hex digits are case-insensitive\n";
        return 1;
    }

    const QueryString query("start=2024-02-01+00%3A00%3A00&end=&limit=25&flag&&limit=7");
    const auto start = query.value("start");
    if (!start || *start != "2024-02-01 00:00:00") {
        std::cerr << "Unexpected start value\n";
        return 1;
    }
    const auto end = query.value("end");
    if (!end || !end->empty()) {
        std::cerr << "Expected an empty end value\n";
        return 1;
    }
    if (const auto flag = query.value("flag"); !flag || !flag->empty()) {
        std::cerr << "Expected a bare key to yield an empty value\n";
        return 1;
    }
    if (query.value("missing") || query.integer("missing") || query.integer("end")) {
        std::cerr << "Expected missing and empty keys to be absent\n";
        return 1;
    }

    // The first occurrence of a repeated key wins.
    const auto limit = query.integer("limit");
    if (!limit || *limit != 25) {
        std::cerr << "Expected limit 25\n";
        return 1;
    }
    if (QueryString("limit=12abc").integer("limit") || QueryString("limit=1.5").integer("limit")) {
        std::cerr << "Expected non-integers to be rejected\n";
        return 1;
    }
    if (const auto negative = QueryString("limit=-3").integer("limit"); !negative || *negative != -3) {
        std::cerr << "Expected negative integers to parse\n";
        return 1;
    }
    if (const auto wide = QueryString("limit=99999999999").integer("limit"); !wide || *wide != 99999999999LL) {
        std::cerr << "Expected values beyond int32 to parse\n";
        return 1;
    }
    if (QueryString("limit=99999999999999999999").integer("limit")) {
        std::cerr << "Expected int64 overflow to be rejected\n";
        return 1;
    }

    return 0;
}
