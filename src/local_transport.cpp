#include "local_transport.hpp"

#include <fcntl.h>
#include <stdio.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "conflict_resolver.hpp"
#include "utils.hpp"

namespace {

constexpr int kMaxPlacementAttempts = 3;

std::filesystem::path staging_path_for(const std::filesystem::path& destination) {
  return destination.parent_path() / ("." + destination.filename().string() + ".mmpart");
}

} // namespace

LocalTransport::LocalTransport(std::shared_ptr<IntegrityValidator> validator,
                               std::shared_ptr<Logger> logger)
  : validator_(validator ? std::move(validator) : std::make_shared<IntegrityValidator>()),
    logger_(std::move(logger)) {}

int LocalTransport::rename_no_replace(const std::filesystem::path& from, const std::filesystem::path& to) {
  if(::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
    return 0;
  }
  int err = errno;
  if(err != EINVAL && err != ENOSYS) return err;

  // Filesystem without RENAME_NOREPLACE (some network mounts): check, then rename.
  std::error_code ec;
  if(std::filesystem::exists(to, ec)) return EEXIST;
  if(std::rename(from.c_str(), to.c_str()) == 0) return 0;
  return errno;
}

void LocalTransport::set_renamer(Renamer renamer) {
  renamer_ = renamer ? std::move(renamer) : Renamer(&LocalTransport::rename_no_replace);
}

TransferOutcome LocalTransport::move(const QueuedFile& item, const MoverConfig& config) {
  const auto& source = item.source_path;
  std::error_code ec;
  auto size = std::filesystem::file_size(source, ec);
  if(ec) {
    return TransferOutcome::skipped(OutcomeReason::Gone, ec.message());
  }

  auto dest_dir = config.destination_dir;
  if(config.mirror_subdirectories) {
    dest_dir /= relative_subdirectory(config.source_dir, source);
  }
  std::filesystem::create_directories(dest_dir, ec);
  if(ec) {
    log_error(logger_.get(), "Cannot create {}: {}", dest_dir.string(), ec.message());
    return TransferOutcome::failed(OutcomeReason::TransferError, ec.message());
  }

  std::optional<std::string> hash;
  if(size <= config.hash_size_limit) {
    hash = sha256_file(source);
    if(!hash) {
      return TransferOutcome::failed(OutcomeReason::TransferError, "unable to hash source");
    }
  }

  const auto requested = dest_dir / source.filename();
  for(int attempt = 0; attempt < kMaxPlacementAttempts; ++attempt) {
    auto resolved = ConflictResolver::resolve(requested, config.conflict_strategy);
    if(!resolved) {
      if(config.conflict_strategy == ConflictStrategy::Skip) {
        log_info(logger_.get(), "{} already present at {}, skipping", source.filename().string(), requested.string());
        return TransferOutcome::skipped(OutcomeReason::AlreadyPresent, requested.string());
      }
      log_error(logger_.get(), "No free destination name for {}", requested.string());
      return TransferOutcome::failed(OutcomeReason::ConflictExhausted, requested.string());
    }

    int err = renamer_(source, *resolved);
    if(err == 0) {
      return finish(source, *resolved, size, hash);
    }
    if(err == EEXIST) {
      // Someone created the name between resolve and rename; resolve again.
      continue;
    }
    if(err == EXDEV) {
      log_debug(logger_.get(), "{} is on another volume, copying", resolved->string());
      return copy_across_volumes(source, *resolved, size, hash);
    }
    log_error(logger_.get(), "rename {} -> {} failed: {}", source.string(), resolved->string(), std::strerror(err));
    return TransferOutcome::failed(OutcomeReason::TransferError, std::strerror(err));
  }
  return TransferOutcome::failed(OutcomeReason::ConflictExhausted, "destination kept changing");
}

TransferOutcome LocalTransport::copy_across_volumes(const std::filesystem::path& source,
                                                    const std::filesystem::path& destination,
                                                    uint64_t size,
                                                    const std::optional<std::string>& hash) {
  auto staged = staging_path_for(destination);
  std::error_code ec;
  std::filesystem::copy_file(source, staged, std::filesystem::copy_options::overwrite_existing, ec);
  if(ec) {
    std::filesystem::remove(staged, ec);
    log_error(logger_.get(), "Copy {} -> {} failed", source.string(), staged.string());
    return TransferOutcome::failed(OutcomeReason::TransferError, "copy failed");
  }

  LocalValidationContext staged_ctx;
  staged_ctx.source = source;
  staged_ctx.destination = staged;
  staged_ctx.expected_size = size;
  staged_ctx.source_hash = hash;
  staged_ctx.expect_source_absent = false;
  auto staged_check = validator_->verify(staged_ctx);
  if(!staged_check) {
    std::filesystem::remove(staged, ec);
    log_error(logger_.get(), "Copy of {} failed validation: {}", source.string(), staged_check.detail);
    return TransferOutcome::failed(OutcomeReason::ValidationFailed, staged_check.detail);
  }

  int err = renamer_(staged, destination);
  if(err != 0) {
    std::filesystem::remove(staged, ec);
    auto reason = err == EEXIST ? OutcomeReason::ConflictExhausted : OutcomeReason::TransferError;
    return TransferOutcome::failed(reason, std::strerror(err));
  }

  if(!std::filesystem::remove(source, ec) || ec) {
    log_error(logger_.get(), "Copied {} but could not delete the source: {}", source.string(), ec.message());
    return TransferOutcome::failed(OutcomeReason::SourceDeleteFailed, ec.message());
  }
  // The hash was already compared on the staged copy.
  return finish(source, destination, size, std::nullopt);
}

TransferOutcome LocalTransport::finish(const std::filesystem::path& source,
                                       const std::filesystem::path& destination,
                                       uint64_t size,
                                       const std::optional<std::string>& hash) {
  LocalValidationContext ctx;
  ctx.source = source;
  ctx.destination = destination;
  ctx.expected_size = size;
  ctx.source_hash = hash;
  auto check = validator_->verify(ctx);
  if(!check) {
    log_error(logger_.get(), "Validation failed for {}: {}", destination.string(), check.detail);
    auto outcome = TransferOutcome::failed(OutcomeReason::ValidationFailed, check.detail);
    outcome.destination = destination.string();
    return outcome;
  }
  log_info(logger_.get(), "Moved {} -> {} ({} bytes)", source.string(), destination.string(), size);
  return TransferOutcome::success(size, destination.string());
}
