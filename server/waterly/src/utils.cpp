#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

#include <array>
#include <ctime>
#include <fstream>
#include <sstream>

namespace waterly {
namespace utils {

bool write_file(const std::string &path, const std::string &contents)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.good()) {
        return false;
    }

    f.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    return f.good();
}

bool read_file(const std::string &path, std::string &out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) {
        return false;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

std::string sha256_hex(const std::string &data)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx)
        throw StoreError("OpenSSL: EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw StoreError("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0f]);
    }
    return out;
}

std::string format_utc(std::time_t ts)
{
    std::tm gm = {};
    gmtime_r(&ts, &gm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &gm);
    return buf;
}

} // namespace utils
} // namespace waterly
