#include "DestinationKeyResolver.hpp"

#include <algorithm>
#include <cctype>

#include <boost/url/parse.hpp>

#include "UtcTime.hpp"
#include "spdlog/spdlog.h"

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

const DestinationKeyResolver::SuffixTable& DestinationKeyResolver::DefaultTable() {
    static const SuffixTable table = {
        {"rent_contracts", "rent_contracts.csv"},
        {"transactions", "transactions.csv"},
        {"projects", "projects.csv"},
        {"units", "units.csv"},
        {"developers", "developers.csv"},
        {"buildings", "buildings.csv"},
    };
    return table;
}

DestinationKeyResolver::DestinationKeyResolver(std::string prefix, SuffixTable table,
                                               std::string default_name)
    : prefix_(std::move(prefix)), table_(std::move(table)), default_name_(std::move(default_name)) {
    // "raw/" and "raw" produce the same keys
    while (!prefix_.empty() && prefix_.back() == '/') {
        prefix_.pop_back();
    }
}

std::string DestinationKeyResolver::ResolveSuffix(std::string_view url) const {
    const std::string lowered = to_lower(url);
    for (const auto& [keyword, suffix] : table_) {
        if (!keyword.empty() && lowered.find(to_lower(keyword)) != std::string::npos) {
            return suffix;
        }
    }

    std::string base = base_name_of(url);
    return base.empty() ? default_name_ : base;
}

std::string DestinationKeyResolver::Resolve(std::string_view url,
                                            std::chrono::system_clock::time_point now) const {
    return BuildKey(ResolveSuffix(url), now);
}

std::string DestinationKeyResolver::BuildKey(std::string_view suffix,
                                             std::chrono::system_clock::time_point now) const {
    std::string key;
    if (!prefix_.empty()) {
        key += prefix_;
        key += '/';
    }
    key += utc::FormatDatePath(now);
    key += '/';
    key += suffix;
    return key;
}

std::string DestinationKeyResolver::base_name_of(std::string_view url) const {
    auto parsed = boost::urls::parse_uri_reference(url);
    if (!parsed) {
        spdlog::debug("[Resolver] Unparseable URL '{}': {}", url, parsed.error().message());
        return {};
    }

    std::string path = parsed->path();
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}
