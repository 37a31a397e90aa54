#include "runner.hpp"
#include "index_source.hpp"
#include "localization.hpp"
#include "repository.hpp"
#include "utils.hpp"
#include "visualizer.hpp"

namespace {

void print_run_settings(const RunConfig& cfg, std::ostream& out) {
    out << "package=" << cfg.package_name << "\n"
        << "repo=" << cfg.repo << "\n"
        << "testMode=" << (cfg.test ? "true" : "false") << "\n"
        << "filter=" << cfg.filter << std::endl;
}

} // namespace

void run_pkgtree(const RunConfig& cfg, std::ostream& out) {
    const bool quiet = get_quiet_mode();
    if (!quiet) {
        print_run_settings(cfg, out);
    }

    const std::string text = load_index_text(cfg);
    const Repository repository = load_repository(text);
    log_info(string_format("info.index_loaded", repository.size()));
    if (!repository.contains(cfg.package_name)) {
        log_warning(string_format("warning.root_not_in_index", cfg.package_name));
    }

    if (!quiet) {
        out << "\n=== Dependency Tree ===" << std::endl;
    }
    print_dependencies(cfg.package_name, cfg.filter, repository, out);
    out.flush();
}
