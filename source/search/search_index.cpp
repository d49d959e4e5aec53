#include "search/search_index.hpp"

#include <algorithm>
#include <cctype>

namespace search_index {

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

static bool is_blank(const std::string &text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char character) { return std::isspace(character) != 0; });
}

void SearchIndex::index(std::vector<ProviderDescriptor> providers) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_ = std::move(providers);
}

std::vector<ProviderDescriptor> SearchIndex::find(const std::string &query, const SearchOptions &options) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const bool match_everything = is_blank(query);
    const std::string lowercase_query = to_lower(query);

    std::vector<ProviderDescriptor> results;
    for (const auto &provider : providers_) {
        if (!options.category.empty() && provider.category != options.category) {
            continue;
        }
        if (!match_everything) {
            // Plain substring search: the query is never interpreted as a pattern.
            std::string searchable_text =
                to_lower(provider.name + " " + provider.category + " " + provider.description);
            if (searchable_text.find(lowercase_query) == std::string::npos) {
                continue;
            }
        }
        results.push_back(provider);
    }
    return results;
}

std::vector<ProviderDescriptor> SearchIndex::get_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_;
}

size_t SearchIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

} // namespace search_index
