#include "repository.hpp"

#include <utility>

Repository::Repository(std::vector<PackageRecord> records) {
    packages_.reserve(records.size());
    for (auto& record : records) {
        add(std::move(record));
    }
}

void Repository::add(PackageRecord record) {
    if (auto it = index_.find(record.name); it != index_.end()) {
        packages_[it->second] = std::move(record);
        return;
    }
    index_.emplace(record.name, packages_.size());
    packages_.push_back(std::move(record));
}

std::optional<PackageRecord> Repository::find_package(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return packages_[it->second];
}

bool Repository::contains(const std::string& name) const {
    return index_.contains(name);
}

Repository load_repository(std::string_view text) {
    return Repository(parse_control_file(text));
}
