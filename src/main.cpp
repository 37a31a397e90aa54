#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "runner.hpp"
#include "utils.hpp"
#include "cxxopts.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options, std::ostream& out) {
    out << options.help({""});
    out << get_string("info.examples") << std::endl;
    out << get_string("info.example_local") << std::endl;
    out << get_string("info.example_remote") << std::endl;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("package", get_string("help.package"), cxxopts::value<std::string>())
            ("repo", get_string("help.repo"), cxxopts::value<std::string>())
            ("test", get_string("help.test"), cxxopts::value<bool>()->default_value("false"))
            ("filter", get_string("help.filter"), cxxopts::value<std::string>()->default_value(""))
            ("sha256", get_string("help.sha256"), cxxopts::value<std::string>())
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"));

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options, std::cout);
            return 0;
        }

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
            init_localization();
        }

        set_quiet_mode(result["quiet"].as<bool>());

        if (!result.count("package")) {
            print_usage(options, std::cerr);
            log_error(get_string("error.missing_package"));
            return 1;
        }

        RunConfig cfg;
        cfg.package_name = trim(result["package"].as<std::string>());
        cfg.test = result["test"].as<bool>();
        cfg.filter = result["filter"].as<std::string>();
        if (result.count("sha256")) {
            cfg.sha256 = result["sha256"].as<std::string>();
        }

        if (cfg.package_name.empty()) {
            log_error(get_string("error.missing_package"));
            return 1;
        }

        if (result.count("repo")) {
            cfg.repo = result["repo"].as<std::string>();
        } else {
            try {
                cfg.repo = get_default_repo();
            } catch (const PkgtreeException& e) {
                print_usage(options, std::cerr);
                log_error(string_format("error.missing_repo", e.what()));
                return 1;
            }
        }

        run_pkgtree(cfg, std::cout);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PkgtreeException& e) {
        log_error(string_format("error.pkgtree_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
