#pragma once

#include <filesystem>

#include "config.hpp"
#include "transfer_types.hpp"

// One way of getting a finished file to its destination. Implementations
// resolve the destination name, transfer, validate and only then remove the
// source.
class TransportBackend {
public:
  virtual ~TransportBackend() = default;

  virtual const char* name() const = 0;
  virtual TransferOutcome move(const QueuedFile& item, const MoverConfig& config) = 0;
};

// Directory of `file` relative to `source_root`; empty when the file sits in
// the root or outside of it.
std::filesystem::path relative_subdirectory(const std::filesystem::path& source_root,
                                            const std::filesystem::path& file);
