#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? err : get_string(fallback_key);
}

} // anonymous namespace

bool is_compressed_index(const fs::path& path) {
    const auto ext = path.extension().string();
    return ext == ".gz" || ext == ".xz" || ext == ".bz2" || ext == ".zst";
}

std::string decompress_index(std::string_view data, const std::string& name) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw PkgtreeException(string_format("error.decompress_failed", name));
    }
    // A compressed index is a bare stream, not a tar: use the raw format.
    archive_read_support_filter_all(a.get());
    archive_read_support_format_raw(a.get());

    if (archive_read_open_memory(a.get(), data.data(), data.size()) != ARCHIVE_OK) {
        throw PkgtreeException(string_format("error.decompress_failed", name) + ": " + archive_error(a.get(), "error.unknown"));
    }

    struct archive_entry* entry;
    int r = archive_read_next_header(a.get(), &entry);
    if (r == ARCHIVE_EOF) {
        return "";
    }
    if (r < ARCHIVE_WARN) {
        throw PkgtreeException(string_format("error.decompress_failed", name) + ": " + archive_error(a.get(), "error.fatal_read"));
    }
    if (r == ARCHIVE_WARN) {
        log_warning(archive_error(a.get(), "error.unknown"));
    }

    std::string content;
    std::array<char, 16384> buffer;
    while (true) {
        la_ssize_t n = archive_read_data(a.get(), buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            if (n == ARCHIVE_WARN) {
                log_warning(archive_error(a.get(), "error.unknown"));
                break;
            }
            throw PkgtreeException(string_format("error.decompress_failed", name) + ": " + archive_error(a.get(), "error.data_block_read"));
        }
        content.append(buffer.data(), static_cast<size_t>(n));
    }
    log_info(string_format("info.decompressed_index", name, data.size(), content.size()));
    return content;
}
