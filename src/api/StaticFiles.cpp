#include "api/StaticFiles.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include "common/Log.hpp"
#include "http/QueryParams.hpp"

namespace fs = std::filesystem;

namespace ohlcv::api {

namespace {

constexpr char kIndexFile[] = "index.html";

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

StaticFiles::StaticFiles(fs::path root) : root_(std::move(root)) {}

std::string StaticFiles::contentTypeFor(const fs::path& file) {
    const auto extension = toLowerCopy(file.extension().string());
    if (extension == ".html" || extension == ".htm") {
        return "text/html; charset=utf-8";
    }
    if (extension == ".js" || extension == ".mjs") {
        return "text/javascript; charset=utf-8";
    }
    if (extension == ".css") {
        return "text/css; charset=utf-8";
    }
    if (extension == ".json" || extension == ".map") {
        return "application/json; charset=utf-8";
    }
    if (extension == ".svg") {
        return "image/svg+xml";
    }
    if (extension == ".png") {
        return "image/png";
    }
    if (extension == ".jpg" || extension == ".jpeg") {
        return "image/jpeg";
    }
    if (extension == ".ico") {
        return "image/x-icon";
    }
    if (extension == ".txt") {
        return "text/plain; charset=utf-8";
    }
    return "application/octet-stream";
}

std::optional<fs::path> StaticFiles::resolve(const std::string& requestPath) const {
    const auto decoded = ohlcv::http::url_decode(requestPath, false);
    if (decoded.empty() || decoded.front() != '/' || decoded.find('\0') != std::string::npos) {
        return std::nullopt;
    }

    fs::path relative;
    std::istringstream segments(decoded);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == ".." || segment.find('\\') != std::string::npos) {
            return std::nullopt;
        }
        relative /= segment;
    }

    auto candidate = root_ / relative;
    std::error_code ec;
    if (fs::is_directory(candidate, ec)) {
        candidate /= kIndexFile;
    }
    if (!fs::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }
    return candidate;
}

std::optional<Response> StaticFiles::serve(const std::string& requestPath) const {
    const auto file = resolve(requestPath);
    if (!file) {
        return std::nullopt;
    }

    std::ifstream input(*file, std::ios::binary);
    if (!input) {
        LOG_WARN("StaticFiles no se pudo abrir " << file->string());
        return std::nullopt;
    }

    std::string body{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        LOG_WARN("StaticFiles error leyendo " << file->string());
        return std::nullopt;
    }

    Response response{200, "OK", std::move(body), contentTypeFor(*file), {}};
    response.headers.emplace_back("Cache-Control", "no-cache");
    return response;
}

}  // namespace ohlcv::api
