#pragma once

#include <functional>
#include <memory>

#include "integrity_validator.hpp"
#include "log.hpp"
#include "transport_backend.hpp"

// Moves files to a local or mounted destination. Same-volume moves are a
// no-replace rename; cross-volume moves copy to a staging name, verify, put
// the copy in place and only then delete the source.
class LocalTransport : public TransportBackend {
public:
  using Renamer = std::function<int(const std::filesystem::path&, const std::filesystem::path&)>;

  LocalTransport(std::shared_ptr<IntegrityValidator> validator,
                 std::shared_ptr<Logger> logger = nullptr);

  const char* name() const override { return "local"; }
  TransferOutcome move(const QueuedFile& item, const MoverConfig& config) override;

  // 0 on success, otherwise an errno value. Never replaces an existing file.
  static int rename_no_replace(const std::filesystem::path& from, const std::filesystem::path& to);
  void set_renamer(Renamer renamer);

private:
  TransferOutcome copy_across_volumes(const std::filesystem::path& source,
                                      const std::filesystem::path& destination,
                                      uint64_t size,
                                      const std::optional<std::string>& hash);
  TransferOutcome finish(const std::filesystem::path& source,
                         const std::filesystem::path& destination,
                         uint64_t size,
                         const std::optional<std::string>& hash);

  std::shared_ptr<IntegrityValidator> validator_;
  std::shared_ptr<Logger> logger_;
  Renamer renamer_ = &LocalTransport::rename_no_replace;
};
