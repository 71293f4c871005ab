//
// Created by gregorian-rayne on 1/13/26.
//

#include "sdkir/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sdkir::hash_utils {

    namespace {

        struct DigestContextDeleter {
            void operator()(EVP_MD_CTX* ctx) const noexcept {
                EVP_MD_CTX_free(ctx);
            }
        };

        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

        std::string compute_hash(const EVP_MD* md, const std::string_view data) {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;

            const DigestContext ctx(EVP_MD_CTX_new());
            if (!ctx) {
                throw std::runtime_error("Failed to create EVP_MD_CTX");
            }

            if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
                throw std::runtime_error("EVP_DigestInit_ex failed");
            }

            if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }

            if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }

            std::ostringstream ss;
            for (unsigned int i = 0; i < hash_len; ++i) {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

    }  // namespace

    std::string sha256_hex(const std::string_view data) {
        return compute_hash(EVP_sha256(), data);
    }

}  // namespace sdkir::hash_utils
