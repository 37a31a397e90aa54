#pragma once

#include "control_file.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Package index keyed by name. Iterates in insertion order; inserting a name
// that is already present replaces its record in place.
class Repository {
public:
    Repository() = default;
    explicit Repository(std::vector<PackageRecord> records);

    void add(PackageRecord record);
    std::optional<PackageRecord> find_package(const std::string& name) const;
    bool contains(const std::string& name) const;

    size_t size() const { return packages_.size(); }
    bool empty() const { return packages_.empty(); }
    const std::vector<PackageRecord>& packages() const { return packages_; }

private:
    std::vector<PackageRecord> packages_;
    std::unordered_map<std::string, size_t> index_; // name -> position in packages_
};

// Parses `text` as a control file and indexes the records.
Repository load_repository(std::string_view text);
