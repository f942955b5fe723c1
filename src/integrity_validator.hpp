#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

struct ValidationResult {
  bool ok = false;
  std::string detail;

  explicit operator bool() const { return ok; }
};

struct LocalValidationContext {
  std::filesystem::path source;
  std::filesystem::path destination;
  uint64_t expected_size = 0;
  std::optional<std::string> source_hash;
  // False while a copy is staged and the source has not been removed yet.
  bool expect_source_absent = true;
};

struct RemoteValidationContext {
  std::string remote_path;
  uint64_t expected_size = 0;
  std::optional<uint64_t> reported_size;
  bool enabled = true;
};

class IntegrityValidator {
public:
  explicit IntegrityValidator(std::shared_ptr<Logger> logger = nullptr);

  ValidationResult verify(const LocalValidationContext& ctx) const;
  ValidationResult verify(const RemoteValidationContext& ctx) const;

private:
  std::shared_ptr<Logger> logger_;
};
