#include "integrity.hpp"
#include "log.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <memory>
#include <vector>

static const EVP_MD* evp_for(HashMethod method) {
    switch (method) {
        case HashMethod::Md5: return EVP_md5();
        case HashMethod::Sha1: return EVP_sha1();
        case HashMethod::Sha224: return EVP_sha224();
        case HashMethod::Sha256: return EVP_sha256();
        case HashMethod::Sha384: return EVP_sha384();
        case HashMethod::Sha512: return EVP_sha512();
        case HashMethod::Sha3_224: return EVP_sha3_224();
        case HashMethod::Sha3_256: return EVP_sha3_256();
        case HashMethod::Sha3_384: return EVP_sha3_384();
        case HashMethod::Sha3_512: return EVP_sha3_512();
        case HashMethod::Blake2b: return EVP_blake2b512();
        case HashMethod::Blake2s: return EVP_blake2s256();
    }
    return nullptr;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::optional<HashMethod> parse_hash_method(const std::string& name) {
    if (name == "md5") return HashMethod::Md5;
    if (name == "sha1") return HashMethod::Sha1;
    if (name == "sha224") return HashMethod::Sha224;
    if (name == "sha256") return HashMethod::Sha256;
    if (name == "sha384") return HashMethod::Sha384;
    if (name == "sha512") return HashMethod::Sha512;
    if (name == "sha3_224") return HashMethod::Sha3_224;
    if (name == "sha3_256") return HashMethod::Sha3_256;
    if (name == "sha3_384") return HashMethod::Sha3_384;
    if (name == "sha3_512") return HashMethod::Sha3_512;
    // Unsized names mean the full-length variants.
    if (name == "blake2b") return HashMethod::Blake2b;
    if (name == "blake2s") return HashMethod::Blake2s;
    return std::nullopt;
}

std::string base64_encode(const unsigned char* data, std::size_t len) {
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), data, (int)len);
    return std::string(reinterpret_cast<const char*>(out.data()), (size_t)n);
}

std::string digest_base64(HashMethod method, const std::string& bytes) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), evp_for(method), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        throw std::runtime_error("digest computation failed");
    }
    return base64_encode(md, md_len);
}

IntegrityResult verify_integrity(const std::string& bytes, const std::optional<Integrity>& expected) {
    if (!expected) {
        log_notice("No integrity block, skipping hash check");
        return IntegrityResult::Skipped;
    }
    auto method = parse_hash_method(expected->method);
    if (!method) {
        log_notice("Unsupported hash method '" + expected->method + "', skipping hash check");
        return IntegrityResult::Skipped;
    }
    if (digest_base64(*method, bytes) == expected->value) {
        log_info("Hashes match (" + expected->method + ")");
        return IntegrityResult::Match;
    }
    log_warning("Hashes do not match (" + expected->method + ")");
    return IntegrityResult::Mismatch;
}

const char* integrity_result_name(IntegrityResult r) {
    switch (r) {
        case IntegrityResult::Skipped: return "skipped";
        case IntegrityResult::Match: return "match";
        case IntegrityResult::Mismatch: return "mismatch";
    }
    return "skipped";
}
