#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

} // anonymous namespace

std::string calculate_sha256(std::string_view data) {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw PkgtreeException(get_string("error.openssl_ctx_failed"));
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw PkgtreeException(get_string("error.openssl_init_failed"));
    }

    if (EVP_DigestUpdate(md_ctx.get(), data.data(), data.size()) != 1) {
        throw PkgtreeException(get_string("error.openssl_update_failed"));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw PkgtreeException(get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

void verify_sha256(std::string_view data, const std::string& expected, const std::string& name) {
    std::string wanted = trim(expected);
    std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string actual = calculate_sha256(data);
    if (actual != wanted) {
        throw PkgtreeException(string_format("error.hash_mismatch", name, wanted, actual));
    }
    log_info(string_format("info.hash_verified", name));
}
