#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "api/Controllers.hpp"

namespace ohlcv::api {

// Serves regular files below a root directory. "/" and directory paths map to
// their index.html.
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    // nullopt when the path escapes the root or names no readable file.
    std::optional<Response> serve(const std::string& requestPath) const;

    const std::filesystem::path& root() const noexcept { return root_; }

    static std::string contentTypeFor(const std::filesystem::path& file);

private:
    std::optional<std::filesystem::path> resolve(const std::string& requestPath) const;

    std::filesystem::path root_;
};

}  // namespace ohlcv::api
