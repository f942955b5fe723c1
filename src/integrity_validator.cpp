#include "integrity_validator.hpp"

#include "utils.hpp"

IntegrityValidator::IntegrityValidator(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

ValidationResult IntegrityValidator::verify(const LocalValidationContext& ctx) const {
  std::error_code ec;
  if(ctx.expect_source_absent && std::filesystem::exists(ctx.source, ec)) {
    return {false, "source still exists at " + ctx.source.string()};
  }
  if(!std::filesystem::is_regular_file(ctx.destination, ec)) {
    return {false, "destination missing: " + ctx.destination.string()};
  }
  auto size = std::filesystem::file_size(ctx.destination, ec);
  if(ec) {
    return {false, "cannot stat destination: " + ec.message()};
  }
  if(size != ctx.expected_size) {
    return {false, fmt::format("size mismatch: expected {} got {}", ctx.expected_size, size)};
  }
  if(ctx.source_hash) {
    auto dest_hash = sha256_file(ctx.destination);
    if(!dest_hash) {
      return {false, "cannot hash destination " + ctx.destination.string()};
    }
    if(*dest_hash != *ctx.source_hash) {
      log_error(logger_.get(), "SHA-256 mismatch for {}: {} != {}",
                ctx.destination.string(), *dest_hash, *ctx.source_hash);
      return {false, "sha256 mismatch"};
    }
  }
  return {true, {}};
}

// Size only: no content hash is computed on the remote side.
ValidationResult IntegrityValidator::verify(const RemoteValidationContext& ctx) const {
  if(!ctx.enabled) return {true, "validation disabled"};
  if(!ctx.reported_size) {
    return {false, "remote file not found: " + ctx.remote_path};
  }
  if(*ctx.reported_size != ctx.expected_size) {
    return {false, fmt::format("remote size mismatch: expected {} got {}",
                               ctx.expected_size, *ctx.reported_size)};
  }
  return {true, {}};
}
