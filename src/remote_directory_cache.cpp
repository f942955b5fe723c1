#include "remote_directory_cache.hpp"

std::string RemoteDirectoryCache::canonicalize(const std::string& remote_dir){
    std::string out;
    out.reserve(remote_dir.size());
    for(char c : remote_dir){
        if(c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while(out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool RemoteDirectoryCache::contains(const std::string& remote_dir) const {
    std::lock_guard lg(m_);
    return created_.count(canonicalize(remote_dir)) > 0;
}

bool RemoteDirectoryCache::mark_created(const std::string& remote_dir){
    std::lock_guard lg(m_);
    return created_.insert(canonicalize(remote_dir)).second;
}

std::size_t RemoteDirectoryCache::size() const {
    std::lock_guard lg(m_);
    return created_.size();
}
