#pragma once

#include <string>
#include <filesystem>

// Global paths (defaults from the build, rebased by set_root_path)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path REPO_CONF;

// Options of a single run, as given on the command line
struct RunConfig {
    std::string package_name;
    std::string repo;
    bool test = false;
    std::string filter;
    std::string sha256;
};

// Functions
void set_root_path(const std::string& root_path);
std::string get_default_repo();
