//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef SDKIR_HASH_UTILS_HPP
#define SDKIR_HASH_UTILS_HPP

#include <string>
#include <string_view>

namespace sdkir::hash_utils {

    /**
     * Computes the SHA-256 digest of the input with OpenSSL EVP.
     *
     * @param data The input bytes to hash.
     * @return Lower-case hexadecimal digest (64 characters).
     * @throws std::runtime_error if the digest context cannot be used.
     */
    std::string sha256_hex(std::string_view data);

}  // namespace sdkir::hash_utils

#endif //SDKIR_HASH_UTILS_HPP
