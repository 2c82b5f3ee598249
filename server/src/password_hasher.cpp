#include "password_hasher.hpp"

#include <crypt.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace vault::server {

namespace {
constexpr char kSaltAlphabet[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789./";
constexpr std::size_t kSaltLength = 16;
}  // namespace

std::string PasswordHasher::generate_salt() {
    std::array<unsigned char, kSaltLength> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::string salt;
    salt.reserve(kSaltLength);
    for (unsigned char byte : random) {
        salt.push_back(kSaltAlphabet[byte % (sizeof(kSaltAlphabet) - 1)]);
    }
    return "$6$" + salt;  // SHA-512 crypt identifier
}

std::string PasswordHasher::hash_password(const std::string& password, const std::string& salt) {
    crypt_data data{};
    data.initialized = 0;
    const std::string salt_spec = salt.rfind("$6$", 0) == 0 ? salt : "$6$" + salt;
    char* hashed = crypt_r(password.c_str(), salt_spec.c_str(), &data);
    if (hashed == nullptr || hashed[0] == '*') {
        throw std::runtime_error("crypt_r failed");
    }
    return std::string(hashed);
}

bool PasswordHasher::verify(const std::string& password,
                            const std::string& salt,
                            const std::string& expected_hash) {
    const std::string attempted = hash_password(password, salt);
    return attempted.size() == expected_hash.size() &&
           CRYPTO_memcmp(attempted.data(), expected_hash.data(), attempted.size()) == 0;
}

}  // namespace vault::server
