#include "app_name_cache.hpp"

namespace ancs {

namespace {

struct KnownApp {
    const char* bundle_id;
    const char* name;
};

constexpr KnownApp kKnownApps[] = {
    {"com.apple.MobileSMS", "Messages"},
    {"com.apple.mobilemail", "Mail"},
    {"com.apple.mobilephone", "Phone"},
    {"com.apple.facetime", "FaceTime"},
    {"com.apple.mobilecal", "Calendar"},
    {"com.apple.reminders", "Reminders"},
    {"com.apple.Preferences", "Settings"},
    {"com.apple.Music", "Music"},
    {"com.apple.AccessibilityUtilities.AXNotificationCenter", "System"},
    {"com.facebook.Messenger", "Messenger"},
    {"com.facebook.Facebook", "Facebook"},
    {"com.atebits.Tweetie2", "Twitter"},
    {"com.burbn.instagram", "Instagram"},
    {"net.whatsapp.WhatsApp", "WhatsApp"},
    {"com.google.Gmail", "Gmail"},
    {"com.spotify.client", "Spotify"},
};

} // anonymous namespace

AppNameCache::AppNameCache(size_t capacity)
    : capacity_(capacity)
{
}

void AppNameCache::seed_defaults()
{
    for (const auto& app : kKnownApps) {
        put(app.bundle_id, app.name);
    }
}

bool AppNameCache::put(std::string_view app_id, std::string_view display_name)
{
    if (app_id.empty() || display_name.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(std::string(app_id));
    if (it != names_.end()) {
        it->second.assign(display_name);
        return true;
    }

    if (names_.size() >= capacity_) {
        return false;
    }

    names_.emplace(std::string(app_id), std::string(display_name));
    return true;
}

std::optional<std::string> AppNameCache::lookup(std::string_view app_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(std::string(app_id));
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t AppNameCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

void AppNameCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    names_.clear();
}

} // namespace ancs
