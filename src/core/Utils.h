#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace revkit {
namespace utils {

// Whole-file reads are capped; module blobs and manifests are small text files.
constexpr size_t kDefaultReadLimit = 16 * 1024 * 1024;

std::vector<std::string> read_lines(const std::string& path);
// nullopt when the file cannot be opened or is larger than max_bytes.
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = kDefaultReadLimit);
bool write_file(const std::string& path, const std::string& content);

std::string trim(const std::string& s);
std::vector<std::string> split_csv(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Strict decimal parse of the whole string (after trimming). No sign for unsigned.
bool parse_int64(const std::string& s, long long& out);

// Lowercase hex SHA-256 digest (OpenSSL EVP).
std::string sha256_hex(const std::string& data);

}
}
