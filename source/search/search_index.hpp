#ifndef MCPDISPATCH_SEARCH_INDEX_HPP
#define MCPDISPATCH_SEARCH_INDEX_HPP

// In-memory keyword/category lookup over the provider set.
// A linear scan: the set is human-curated (hundreds of entries, not millions).

#include <mutex>
#include <string>
#include <vector>

#include "registry/provider_descriptor.hpp"

namespace search_index {

using provider_registry::ProviderDescriptor;

struct SearchOptions {
    std::string category; // exact match; empty means no filter
};

class SearchIndex {
public:
    // Replace the whole indexed set.
    void index(std::vector<ProviderDescriptor> providers);

    // Category filter first, then a case-insensitive literal substring test
    // against "name category description". A blank query returns the
    // (possibly filtered) set in indexed order.
    std::vector<ProviderDescriptor> find(const std::string &query,
                                         const SearchOptions &options = SearchOptions()) const;

    // Copy of the full indexed set.
    std::vector<ProviderDescriptor> get_all() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ProviderDescriptor> providers_;
};

} // namespace search_index

#endif // MCPDISPATCH_SEARCH_INDEX_HPP
