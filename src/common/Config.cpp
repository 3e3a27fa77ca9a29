#include "common/Config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace ohlcv::common {
namespace {

enum class Source { Environment, Flag };

std::string trim(const std::string& value) {
    const auto notSpace = [](unsigned char ch) { return std::isspace(ch) == 0; };
    const auto first = std::find_if(value.begin(), value.end(), notSpace);
    const auto last = std::find_if(value.rbegin(), value.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string{};
}

template <typename T>
T parseBounded(const std::string& value, long long min, long long max, const std::string& message) {
    const auto text = trim(value);
    long long parsed = 0;
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, parsed);
    if (text.empty() || result.ec != std::errc{} || result.ptr != end || parsed < min || parsed > max) {
        throw std::runtime_error(message + value);
    }
    return static_cast<T>(parsed);
}

bool parseBool(const std::string& value) {
    static const std::array<const char*, 4> truthy{"true", "1", "yes", "on"};
    static const std::array<const char*, 4> falsy{"false", "0", "no", "off"};

    std::string normalized = trim(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (std::find(truthy.begin(), truthy.end(), normalized) != truthy.end()) {
        return true;
    }
    if (std::find(falsy.begin(), falsy.end(), normalized) != falsy.end()) {
        return false;
    }
    throw std::runtime_error("Valor booleano inválido: " + value);
}

// A blank path in the environment leaves the previous value in place; a blank
// path passed as a flag is an error.
void assignPath(std::string& target, const std::string& value, Source source, const char* label) {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        if (source == Source::Environment) {
            return;
        }
        throw std::runtime_error(std::string{"Ruta vacía para "} + label);
    }
    target = std::move(trimmed);
}

std::int32_t parseLimit(const std::string& value, const char* label) {
    return parseBounded<std::int32_t>(value, 1, std::numeric_limits<std::int32_t>::max(),
                                      std::string{"Valor inválido para "} + label + ": ");
}

using Apply = void (*)(Config&, const std::string&, Source, const char*);

struct Setting {
    const char* env;  // nullptr when only the flag exists
    const char* flag;
    Apply apply;
};

const std::array<Setting, 11> kSettings{{
    {"PORT", "--port",
     [](Config& c, const std::string& v, Source, const char*) {
         c.port = parseBounded<std::uint16_t>(v, 1, 65535, "Puerto inválido: ");
     }},
    {"BIND_ADDRESS", "--bind",
     [](Config& c, const std::string& v, Source s, const char* label) { assignPath(c.bindAddress, v, s, label); }},
    {"LOG_LEVEL", "--log-level",
     [](Config& c, const std::string& v, Source, const char*) { c.logLevel = ohlcv::log::levelFromString(trim(v)); }},
    {"THREADS", "--threads",
     [](Config& c, const std::string& v, Source, const char*) {
         c.threads = parseBounded<std::size_t>(v, 1, 256, "Valor de threads inválido: ");
     }},
    {"DUCKDB_PATH", "--duckdb",
     [](Config& c, const std::string& v, Source s, const char* label) { assignPath(c.duckdbPath, v, s, label); }},
    {"CSV_PATH", "--csv",
     [](Config& c, const std::string& v, Source s, const char* label) { assignPath(c.csvPath, v, s, label); }},
    {"STATIC_DIR", "--static-dir",
     [](Config& c, const std::string& v, Source s, const char* label) { assignPath(c.staticDir, v, s, label); }},
    {"HTTP_DEFAULT_LIMIT", "--http-default-limit",
     [](Config& c, const std::string& v, Source, const char* label) { c.httpDefaultLimit = parseLimit(v, label); }},
    {"HTTP_MAX_LIMIT", "--http-max-limit",
     [](Config& c, const std::string& v, Source, const char* label) { c.httpMaxLimit = parseLimit(v, label); }},
    {nullptr, "--http.cors.enable",
     [](Config& c, const std::string& v, Source, const char*) { c.httpCorsEnable = parseBool(v); }},
    {nullptr, "--http.cors.origin",
     [](Config& c, const std::string& v, Source, const char*) { c.httpCorsOrigin = trim(v); }},
}};

// "--key value" and "--key=value"; the first occurrence of a key wins.
std::map<std::string, std::string> collectFlags(int argc, char** argv) {
    std::map<std::string, std::string> flags;
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        const auto eq = arg.find('=');
        if (eq != std::string::npos) {
            flags.emplace(arg.substr(0, eq), arg.substr(eq + 1));
        } else if (i + 1 < argc) {
            flags.emplace(arg, argv[i + 1]);
            ++i;
        }
    }
    return flags;
}

void ensureParentDirectory(const std::filesystem::path& file) {
    const auto parent = file.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("No se pudo crear el directorio para DuckDB (" + parent.string() + "): " +
                                 ec.message());
    }
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    for (const auto& setting : kSettings) {
        if (setting.env == nullptr) {
            continue;
        }
        if (const char* value = std::getenv(setting.env)) {
            setting.apply(config, value, Source::Environment, setting.env);
        }
    }

    const auto flags = collectFlags(argc, argv);
    for (const auto& setting : kSettings) {
        const auto it = flags.find(setting.flag);
        if (it != flags.end() && !it->second.empty()) {
            setting.apply(config, it->second, Source::Flag, setting.flag);
        }
    }

    config.httpDefaultLimit = std::min(config.httpDefaultLimit, config.httpMaxLimit);

    ensureParentDirectory(config.duckdbPath);
    LOG_DEBUG("DuckDB path: " << config.duckdbPath);

    return config;
}

}  // namespace ohlcv::common
