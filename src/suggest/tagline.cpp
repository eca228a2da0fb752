#include "suggest/tagline.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace forge {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::atomic<bool> g_key_warning_shown{false};

}

const std::vector<OfflineSuggestions::Entry>& OfflineSuggestions::table() {
    static const std::vector<Entry> entries = {
        {"bannerforge", {"Forge Your Visual Identity", "Create. Design. Deploy.", "Professional Banners Made Simple"}},
    };
    return entries;
}

const std::vector<std::string>& OfflineSuggestions::default_taglines() {
    static const std::vector<std::string> taglines = {
        "See What Others Miss", "Innovation Through Design", "Crafted with Precision"};
    return taglines;
}

std::vector<std::string> OfflineSuggestions::suggest(const std::string& text, size_t count) const {
    const std::string needle = to_lower(text);

    const std::vector<std::string>* source = &default_taglines();
    for (const auto& entry : table()) {
        if (needle.find(entry.keyword) != std::string::npos) {
            source = &entry.taglines;
            break;
        }
    }

    const size_t n = std::min(count, source->size());
    return std::vector<std::string>(source->begin(), source->begin() + static_cast<std::ptrdiff_t>(n));
}

std::unique_ptr<SuggestionService> make_suggestion_service(const std::string& api_key_env) {
    const std::string var = api_key_env.empty() ? DEFAULT_API_KEY_ENV : api_key_env;
    const char* key = std::getenv(var.c_str());
    if (key && *key && !g_key_warning_shown.exchange(true)) {
        std::cerr << "Warning: " << var << " is set but no remote suggestion client is available; "
                  << "using offline taglines\n";
    }
    return std::make_unique<OfflineSuggestions>();
}

}
