#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @brief Maps a source URL onto its destination object key.
 *
 * @details
 * The canonical name ("suffix") comes from the first entry of an ordered
 * keyword table found in the lower-cased URL. Table order decides between
 * overlapping keywords, not match length. Without a match the base name of
 * the URL path is used, and when that is empty the default name.
 *
 * The key is `<prefix>/<YYYY>/<MM>/<DD>/<suffix>` for the UTC calendar day.
 * Pure: no I/O, no shared state.
 */
class DestinationKeyResolver {
   public:
    using SuffixTable = std::vector<std::pair<std::string, std::string>>;

    static const SuffixTable& DefaultTable();
    static constexpr std::string_view kDefaultName = "data.csv";

    explicit DestinationKeyResolver(std::string prefix, SuffixTable table = DefaultTable(),
                                    std::string default_name = std::string(kDefaultName));

    std::string ResolveSuffix(std::string_view url) const;

    std::string Resolve(std::string_view url,
                        std::chrono::system_clock::time_point now =
                            std::chrono::system_clock::now()) const;

    // Key for an already resolved suffix.
    std::string BuildKey(std::string_view suffix, std::chrono::system_clock::time_point now) const;

    const std::string& prefix() const { return prefix_; }

   private:
    std::string base_name_of(std::string_view url) const;

    std::string prefix_;
    SuffixTable table_;
    std::string default_name_;
};
