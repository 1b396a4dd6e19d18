#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace gffkit {

// Maps a talk-table reference to display text. Implementations must allow
// concurrent resolve() calls and throw GffError(Lookup) for unknown ids.
class StringResolver {
public:
    virtual ~StringResolver() = default;
    virtual std::string resolve(std::uint32_t string_ref) const = 0;
};

// In-memory table, e.g. loaded from an "id<TAB>text" listing.
class MapStringResolver : public StringResolver {
public:
    MapStringResolver() = default;

    void add(std::uint32_t string_ref, std::string text);

    std::string resolve(std::uint32_t string_ref) const override;

    std::size_t size() const;

    // Number of resolve() calls served so far, hits and misses alike.
    std::size_t lookup_count() const noexcept { return lookups_.load(); }

    /// Add every line of the form "<id>\t<text>". Blank lines and lines starting
    /// with '#' are skipped. Returns the number of entries read.
    std::size_t load(const std::filesystem::path& file);

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::uint32_t, std::string> entries_;
    mutable std::atomic<std::size_t> lookups_{0};
};

} // namespace gffkit
