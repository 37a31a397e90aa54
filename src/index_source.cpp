#include "index_source.hpp"
#include "archive.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <string_view>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view FILE_SCHEME = "file://";

constexpr std::array<std::string_view, 5> INDEX_FILE_NAMES = {
    "Packages", "Packages.gz", "Packages.xz", "Packages.bz2", "Packages.zst"
};

std::string last_path_component(std::string_view url) {
    const auto pos = url.find_last_of('/');
    return std::string(pos == std::string_view::npos ? url : url.substr(pos + 1));
}

// Checks and unpacks the raw bytes of an index file called `name`.
std::string finish_index(std::string raw, const std::string& name, const std::string& expected_sha256) {
    if (!expected_sha256.empty()) {
        verify_sha256(raw, expected_sha256, name);
    }
    if (is_compressed_index(name)) {
        return decompress_index(raw, name);
    }
    return raw;
}

} // anonymous namespace

bool is_local_source(const std::string& repo, bool test_mode) {
    return test_mode || repo.starts_with(FILE_SCHEME) || repo.starts_with("/");
}

fs::path resolve_local_index_path(const std::string& repo) {
    fs::path path = repo.starts_with(FILE_SCHEME) ? repo.substr(FILE_SCHEME.size()) : repo;
    if (fs::is_directory(path)) {
        path /= "Packages";
    }
    return path;
}

std::string resolve_index_url(const std::string& repo) {
    const std::string last = last_path_component(repo);
    for (const auto name : INDEX_FILE_NAMES) {
        if (last == name) return repo;
    }
    if (!repo.empty() && repo.back() == '/') {
        return repo + "Packages";
    }
    return repo + "/Packages";
}

std::string load_index_text(const RunConfig& cfg) {
    if (is_local_source(cfg.repo, cfg.test)) {
        const fs::path index_path = resolve_local_index_path(cfg.repo);
        if (!fs::exists(index_path)) {
            throw PkgtreeException(string_format("error.index_not_found", index_path.string()));
        }
        log_info(string_format("info.reading_local_index", index_path.string()));
        return finish_index(read_file_to_string(index_path), index_path.string(), cfg.sha256);
    }

    const std::string url = resolve_index_url(cfg.repo);
    log_info(string_format("info.fetching_index", url));
    return finish_index(fetch_url(url), last_path_component(url), cfg.sha256);
}
