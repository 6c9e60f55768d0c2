#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace paperback {

typedef std::vector<unsigned char> Bytes;

/* digests (OpenSSL EVP) */
Bytes sha256(const Bytes& data);
std::string sha256_hex(const Bytes& data);
std::string to_hex(const Bytes& data);
bool is_sha256_hex(const std::string& s);

/* base64, RFC 4648 alphabet, padded, no line breaks */
std::string base64_encode(const unsigned char* p,size_t n);
inline std::string base64_encode(const Bytes& v){ return base64_encode(v.data(),v.size()); }
inline std::string base64_encode(const std::string& s){ return base64_encode((const unsigned char*)s.data(),s.size()); }
// Strict: rejects whitespace, misplaced padding and lengths not divisible by 4.
bool base64_decode(const std::string& s,Bytes& out);
inline size_t base64_length(size_t n){ return 4*((n+2)/3); }

} // namespace paperback
