#pragma once

#include <string>
#include <unordered_map>

namespace allpair::core::cluster {

// Human-readable names for hosts (e.g. pod name -> physical node), read from a
// two-column CSV. Missing hosts resolve to "unknown".
class NodeAliasMap {
public:
    static constexpr const char* kUnknown = "unknown";

    static NodeAliasMap LoadFile(const std::string& path, std::string* error);

    void Set(const std::string& host, const std::string& alias) { aliases_[host] = alias; }
    std::string Lookup(const std::string& host) const;
    size_t size() const { return aliases_.size(); }

private:
    std::unordered_map<std::string, std::string> aliases_;
};

}  // namespace allpair::core::cluster
