#include "control_file.hpp"
#include "dependency_field.hpp"
#include "utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace {

constexpr std::string_view PACKAGE_TAG = "Package:";
constexpr std::string_view DEPENDS_TAG = "Depends:";

class RecordBuilder {
public:
    explicit RecordBuilder(std::vector<PackageRecord>& out) : out_(out) {}

    void feed(std::string_view line) {
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (is_blank(line)) {
            flush();
            return;
        }

        if (line.front() == ' ' || line.front() == '\t') {
            // Continuation line: folds into the previous field.
            if (in_depends_ && depends_buf_) {
                *depends_buf_ += " " + trim(line);
            }
            return;
        }

        in_depends_ = false;
        if (line.starts_with(PACKAGE_TAG)) {
            if (current_) flush();
            current_ = PackageRecord{.name = trim(line.substr(PACKAGE_TAG.size())), .dependencies = {}};
        } else if (line.starts_with(DEPENDS_TAG)) {
            depends_buf_ = trim(line.substr(DEPENDS_TAG.size()));
            in_depends_ = true;
        }
    }

    void flush() {
        if (current_) {
            if (depends_buf_) {
                current_->dependencies = parse_dependency_field(*depends_buf_);
            }
            out_.push_back(std::move(*current_));
        }
        current_.reset();
        depends_buf_.reset();
        in_depends_ = false;
    }

private:
    std::vector<PackageRecord>& out_;
    std::optional<PackageRecord> current_;
    std::optional<std::string> depends_buf_;
    bool in_depends_ = false;
};

} // anonymous namespace

std::vector<PackageRecord> parse_control_file(std::string_view text) {
    std::vector<PackageRecord> records;
    RecordBuilder builder(records);

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        builder.feed(text.substr(start, end - start));
        start = end + 1;
    }
    builder.flush();
    return records;
}
