#include "Utils.h"
#include <fstream>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace revkit {
namespace utils {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream f(path);
    if(!f.is_open()) return lines;
    std::string line;
    while(std::getline(f, line)) {
        if(!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<std::string> read_file(const std::string& path, size_t max_bytes) {
    std::ifstream f(path, std::ios::binary);
    if(!f.is_open()) return std::nullopt;
    std::string out;
    char buf[8192];
    while(f.read(buf, sizeof(buf)).gcount() > 0) {
        size_t got = static_cast<size_t>(f.gcount());
        if(got > max_bytes - out.size()) return std::nullopt;
        out.append(buf, got);
    }
    return out;
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f.is_open()) return false;
    f << content;
    return static_cast<bool>(f.flush());
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t b = s.find_first_not_of(ws);
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for(char c : s) {
        if(c == ',') { cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    cur = trim(cur);
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for(size_t i = 0; i < parts.size(); ++i) {
        if(i) out += sep;
        out += parts[i];
    }
    return out;
}

bool parse_int64(const std::string& s, long long& out) {
    std::string t = trim(s);
    if(t.empty()) return false;
    size_t i = (t[0] == '-' || t[0] == '+') ? 1 : 0;
    if(i == t.size()) return false;
    for(size_t k = i; k < t.size(); ++k) if(t[k] < '0' || t[k] > '9') return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if(errno == ERANGE || end == nullptr || *end != '\0') return false;
    out = v;
    return true;
}

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    if(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
       EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
       EVP_DigestFinal_ex(ctx.get(), md, &mdlen) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }
    static const char* hx = "0123456789abcdef";
    std::string hex;
    hex.reserve(mdlen * 2);
    for(unsigned i = 0; i < mdlen; ++i) { hex.push_back(hx[md[i] >> 4]); hex.push_back(hx[md[i] & 0xF]); }
    return hex;
}

}
}
