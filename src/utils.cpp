#include "utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string hex_encode(const char* data, std::size_t size) {
  std::string out;
  out.resize(size * 2);
  for(std::size_t i = 0; i < size; ++i) {
    auto byte = static_cast<unsigned char>(data[i]);
    out[2 * i] = kHexDigits[byte >> 4];
    out[2 * i + 1] = kHexDigits[byte & 0x0f];
  }
  return out;
}

// Whitespace between digit pairs is ignored, matching `xxd -r -p`.
bool hex_decode(const std::string& text, std::vector<char>& out) {
  int high = -1;
  for(char c : text) {
    if(std::isspace(static_cast<unsigned char>(c))) continue;
    int v = hex_value(c);
    if(v < 0) return false;
    if(high < 0) {
      high = v;
    } else {
      out.push_back(static_cast<char>((high << 4) | v));
      high = -1;
    }
  }
  return high < 0;
}

std::optional<std::string> sha256_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::nullopt;
  }

  std::vector<char> buffer(1 << 20);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      return std::nullopt;
    }
  }
  if(in.bad()) return std::nullopt;

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    return std::nullopt;
  }
  digest.resize(length);
  return hex_from_bytes(digest);
}

std::string shell_quote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for(char c : value) {
    if(c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

bool contains_whitespace(const std::string& value) {
  for(char c : value) {
    if(std::isspace(static_cast<unsigned char>(c))) return true;
  }
  return false;
}

std::string format_local_time(std::chrono::system_clock::time_point when, const char* pattern) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);
  std::array<char, 64> buffer{};
  auto written = std::strftime(buffer.data(), buffer.size(), pattern, &local);
  return std::string(buffer.data(), written);
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) out += separator;
    out += parts[i];
  }
  return out;
}
