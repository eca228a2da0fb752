#pragma once

#include <memory>
#include <string>
#include <vector>

namespace forge {

constexpr const char* DEFAULT_API_KEY_ENV = "GEMINI_API_KEY";

class SuggestionService {
public:
    virtual ~SuggestionService() = default;

    // At most `count` taglines for `text`. Never fails.
    virtual std::vector<std::string> suggest(const std::string& text, size_t count) const = 0;
    virtual const char* name() const = 0;
};

// Deterministic keyword table, matched by lowercase substring of the text.
class OfflineSuggestions : public SuggestionService {
public:
    std::vector<std::string> suggest(const std::string& text, size_t count) const override;
    const char* name() const override { return "offline"; }

    struct Entry {
        const char* keyword;
        std::vector<std::string> taglines;
    };
    static const std::vector<Entry>& table();
    static const std::vector<std::string>& default_taglines();
};

// No remote client is built in, so this always returns the offline table.
// A configured key triggers a one-time warning that it is being ignored.
std::unique_ptr<SuggestionService> make_suggestion_service(const std::string& api_key_env);

}
