#pragma once
#include <string>
#include <optional>

#include "job.hpp"

enum class HashMethod {
    Md5, Sha1, Sha224, Sha256, Sha384, Sha512,
    Sha3_224, Sha3_256, Sha3_384, Sha3_512,
    Blake2b, Blake2s
};

enum class IntegrityResult { Skipped, Match, Mismatch };

// Maps the method names used in notifications ("sha512", "sha3_256", ...)
// onto the supported algorithms. Unknown names yield nullopt.
std::optional<HashMethod> parse_hash_method(const std::string& name);

std::string base64_encode(const unsigned char* data, std::size_t len);
std::string digest_base64(HashMethod method, const std::string& bytes);

// Skipped when there is no integrity block or the method is unsupported;
// otherwise compares the base64 digest with the expected value exactly.
IntegrityResult verify_integrity(const std::string& bytes, const std::optional<Integrity>& expected);

const char* integrity_result_name(IntegrityResult r);
