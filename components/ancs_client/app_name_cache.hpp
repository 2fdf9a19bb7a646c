/**
 * @file app_name_cache.hpp
 * @brief Bundle identifier to display name lookup
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ancs {

class AppNameCache {
public:
    static constexpr size_t kDefaultCapacity = 64;

    explicit AppNameCache(size_t capacity = kDefaultCapacity);

    /**
     * @brief Load the built-in names of common iOS apps
     */
    void seed_defaults();

    /**
     * @return false when the cache is full and @p app_id is new
     */
    bool put(std::string_view app_id, std::string_view display_name);

    std::optional<std::string> lookup(std::string_view app_id) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> names_;
    size_t capacity_;
};

} // namespace ancs
