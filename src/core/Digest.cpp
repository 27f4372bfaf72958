#include "Digest.h"
#include "Logging.h"
#include <openssl/evp.h>

namespace secret_guard {

std::string sha256_hex(const std::string& data) {
    std::string hexsum;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) { Logger::instance().warn("sha256: EVP_MD_CTX_new failed"); return hexsum; }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
        && EVP_DigestFinal_ex(ctx, md, &mdlen) == 1;
    EVP_MD_CTX_free(ctx);
    if(!ok) { Logger::instance().warn("sha256: digest failed"); return hexsum; }
    static const char* hx = "0123456789abcdef";
    hexsum.reserve(mdlen * 2);
    for(unsigned i = 0; i < mdlen; ++i) { hexsum.push_back(hx[md[i] >> 4]); hexsum.push_back(hx[md[i] & 0xF]); }
    return hexsum;
}

} // namespace secret_guard
