#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = PKGTREE_CONF_DIR;
fs::path L10N_DIR = PKGTREE_L10N_DIR;

// Derived paths
fs::path REPO_CONF = fs::path(PKGTREE_CONF_DIR) / "repo.conf";

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(PKGTREE_CONF_DIR);
    L10N_DIR = rebase(PKGTREE_L10N_DIR);

    REPO_CONF = CONFIG_DIR / "repo.conf";
}

std::string get_default_repo() {
    std::ifstream repo_file(REPO_CONF);
    if (!repo_file.is_open()) {
        throw PkgtreeException(string_format("error.open_file_failed", REPO_CONF.string()));
    }
    std::string repo;
    if (!std::getline(repo_file, repo)) {
        throw PkgtreeException(get_string("error.invalid_repo_config"));
    }
    repo = trim(repo);
    if (repo.empty()) {
        throw PkgtreeException(get_string("error.invalid_repo_config"));
    }
    return repo;
}
