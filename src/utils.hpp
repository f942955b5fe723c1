#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_encode(const char* data, std::size_t size);
bool hex_decode(const std::string& text, std::vector<char>& out);

// SHA-256 of the file contents as lowercase hex; nullopt when unreadable.
std::optional<std::string> sha256_file(const std::filesystem::path& path);

// Wrap a value in single quotes for a POSIX shell.
std::string shell_quote(const std::string& value);
bool contains_whitespace(const std::string& value);

std::string format_local_time(std::chrono::system_clock::time_point when, const char* pattern);
std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);
