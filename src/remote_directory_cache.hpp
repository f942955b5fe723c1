#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

// Remote directories created during this run, as `user@host:/dir`. Entries
// are never invalidated.
class RemoteDirectoryCache {
public:
    static std::string canonicalize(const std::string& remote_dir);

    bool contains(const std::string& remote_dir) const;
    // Returns false if the directory was already recorded.
    bool mark_created(const std::string& remote_dir);
    std::size_t size() const;
private:
    mutable std::mutex m_;
    std::unordered_set<std::string> created_;
};
