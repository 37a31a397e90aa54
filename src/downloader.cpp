#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

constexpr long CONNECT_TIMEOUT_SECONDS = 30;
constexpr const char* USER_AGENT = "pkgtree/1.0";

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

int report_progress([[maybe_unused]] void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (dltotal > 0) {
        log_progress(get_string("info.downloading"), static_cast<double>(dlnow) * 100.0 / static_cast<double>(dltotal));
    }
    return 0;
}

// One transfer; the whole index is kept in `body`.
std::string fetch_once(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw PkgtreeException(string_format("error.download_failed", url));
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, get_quiet_mode() ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, report_progress);

    const CURLcode res = curl_easy_perform(curl.get());
    if (!get_quiet_mode() && isatty(STDERR_FILENO)) {
        std::cerr << std::endl;
    }
    if (res != CURLE_OK) {
        throw PkgtreeException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
    return body;
}

} // anonymous namespace

std::string fetch_url(const std::string& url, int max_attempts) {
    for (int attempt = 1;; ++attempt) {
        try {
            std::string body = fetch_once(url);
            log_info(string_format("info.fetched_bytes", body.size(), url));
            return body;
        } catch (const PkgtreeException& e) {
            if (attempt >= max_attempts) throw;
            log_warning(string_format("warning.download_retry", e.what(), attempt, max_attempts));
        }
    }
}
