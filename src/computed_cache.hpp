#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <functional>

// Key of a computed artifact: which collaborator produced it, from which input.
struct CacheKey
{
    std::string collaborator;   // "MainThreadTasks", "NetworkRecords"
    std::string identity;       // content hash of the input

    bool operator==(const CacheKey& o) const noexcept
    {
        return collaborator == o.collaborator && identity == o.identity;
    }
};

struct CacheKeyHash
{
    size_t operator()(const CacheKey& k) const noexcept
    {
        std::hash<std::string> H;
        return (H(k.collaborator) * 1315423911u) ^ H(k.identity);
    }
};

// 64-bit FNV-1a of the input, as 16 hex digits.
inline std::string content_identity(std::string_view data)
{
    uint64_t h = 14695981039346656037ull;
    for (unsigned char c : data)
    {
        h ^= c;
        h *= 1099511628211ull;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return buf;
}

// Memo of collaborator results shared by every consumer of one analysis run.
template <class Value>
class ComputedCache
{
public:
    std::optional<Value> get(const CacheKey& key) const
    {
        std::lock_guard<std::mutex> lk(_mtx);
        auto it = _entries.find(key);
        if (it == _entries.end()) return std::nullopt;
        return it->second;
    }

    void put(const CacheKey& key, Value value)
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _entries.insert_or_assign(key, std::move(value));
    }

    // Value for `key`, computing it on a miss. `compute(Value&)` returns false on failure;
    // failures are not stored. The lock is not held while computing.
    template <class Fn>
    bool get_or_compute(const CacheKey& key, Value& out, Fn&& compute)
    {
        if (auto hit = get(key))
        {
            out = std::move(*hit);
            return true;
        }
        Value v{};
        if (!compute(v))
            return false;

        std::lock_guard<std::mutex> lk(_mtx);
        // another caller may have filled it meanwhile; keep the first one
        auto it = _entries.try_emplace(key, std::move(v)).first;
        out = it->second;
        return true;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lk(_mtx);
        return _entries.size();
    }

    // Drop the entries of `collaborator` except the one computed from `identity` (all of them when unset).
    void retain_only(const std::string& collaborator, const std::optional<std::string>& identity)
    {
        std::lock_guard<std::mutex> lk(_mtx);
        std::erase_if(_entries, [&](const auto& kv)
        {
            return kv.first.collaborator == collaborator && (!identity || kv.first.identity != *identity);
        });
    }

    void clear()
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _entries.clear();
    }

private:
    mutable std::mutex _mtx;
    std::unordered_map<CacheKey, Value, CacheKeyHash> _entries;
};
