// Tests for keyword and category lookup over the provider set.

#include "search/search_index.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>
#include <vector>

using provider_registry::ProviderDescriptor;
using search_index::SearchIndex;
using search_index::SearchOptions;
using test_support::check;

namespace test_search_index {

static ProviderDescriptor make_provider(const std::string &name, const std::string &category,
                                        const std::string &description) {
    ProviderDescriptor descriptor;
    descriptor.name = name;
    descriptor.category = category;
    descriptor.description = description;
    descriptor.path = "/opt/providers/" + name + "/index.js";
    return descriptor;
}

static std::vector<ProviderDescriptor> sample_providers() {
    return {
        make_provider("postgres-mcp", "database", "Query PostgreSQL databases"),
        make_provider("gmail-mcp", "google", "Read and send Gmail messages"),
        make_provider("sqlite-mcp", "database", "Local SQLite files"),
        make_provider("youtube-mcp", "media", "Fetch YouTube transcripts"),
        make_provider("test[.*]mcp", "utilities", "Pattern characters in the name"),
    };
}

// Test: matching is case-insensitive across name, category and description.
static bool test_case_insensitive_match() {
    SearchIndex index;
    index.index(sample_providers());
    auto by_description = index.find("POSTGRESQL");
    auto by_category = index.find("Google");
    bool success = by_description.size() == 1 && by_description[0].name == "postgres-mcp" &&
                   by_category.size() == 1 && by_category[0].name == "gmail-mcp";
    return check(success, "query matches case-insensitively on description and category");
}

// Test: pattern metacharacters in the query are literal.
static bool test_literal_metacharacters() {
    SearchIndex index;
    index.index(sample_providers());
    auto results = index.find("[.*]");
    auto dot_star = index.find(".*");
    bool success = results.size() == 1 && results[0].name == "test[.*]mcp" && dot_star.size() == 1;
    return check(success, "\"[.*]\" matches only the entry literally containing it");
}

// Test: empty query with a category returns exactly that subset in indexed order.
static bool test_category_filter_preserves_order() {
    SearchIndex index;
    index.index(sample_providers());
    SearchOptions options;
    options.category = "database";
    auto results = index.find("", options);
    bool success = results.size() == 2 && results[0].name == "postgres-mcp" && results[1].name == "sqlite-mcp";
    return check(success, "category filter returns the subset in indexed order");
}

// Test: category filter applies before the keyword test.
static bool test_category_then_query() {
    SearchIndex index;
    index.index(sample_providers());
    SearchOptions options;
    options.category = "media";
    auto results = index.find("mcp", options);
    return check(results.size() == 1 && results[0].name == "youtube-mcp", "category filter narrows keyword matches");
}

// Test: index() replaces the whole set; get_all() returns a copy.
static bool test_index_replaces_set() {
    SearchIndex index;
    index.index(sample_providers());
    index.index({make_provider("only", "files", "single entry")});
    auto all = index.get_all();
    all.clear();
    bool success = index.size() == 1 && index.get_all()[0].name == "only" && index.find("postgres").empty();
    return check(success, "index() replaces the set and get_all() is a defensive copy");
}

// Test: blank query without a category returns everything.
static bool test_blank_query_returns_all() {
    SearchIndex index;
    index.index(sample_providers());
    return check(index.find("   ").size() == sample_providers().size(), "blank query returns the full set");
}

// Test: a five-thousand-entry scan stays well under 100ms.
static bool test_scan_latency() {
    std::vector<ProviderDescriptor> providers;
    for (int number = 0; number < 5000; ++number) {
        providers.push_back(make_provider("provider-" + std::to_string(number), "utilities",
                                          "Generated provider number " + std::to_string(number)));
    }
    SearchIndex index;
    index.index(providers);

    auto start_time = std::chrono::steady_clock::now();
    auto results = index.find("number 4999");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

    bool success = results.size() == 1 && elapsed.count() < 100;
    return check(success, "5000-entry search took " + std::to_string(elapsed.count()) + " ms");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_case_insensitive_match();
    all_passed &= test_literal_metacharacters();
    all_passed &= test_category_filter_preserves_order();
    all_passed &= test_category_then_query();
    all_passed &= test_index_replaces_set();
    all_passed &= test_blank_query_returns_all();
    all_passed &= test_scan_latency();
    return all_passed;
}

} // namespace test_search_index
