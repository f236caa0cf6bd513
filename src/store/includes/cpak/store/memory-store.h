#pragma once

#include "cpak/store/store.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cpak::store {

/**
 * Store kept entirely in a std::map. Records the writes and compactions it
 * receives so callers can observe how a run used the store.
 */
class MemoryStore : public Store
{
public:
    MemoryStore() = default;

    std::optional<std::string>
    get_raw(std::string_view key) override;

    void
    scan(const ScanOptions& options, const ScanCallback& callback) override;

    void
    write(const WriteBatch& batch) override;

    void
    compact_range(std::string_view first, std::string_view last) override;

    // Store a raw encoded value directly, bypassing batches
    void
    put_raw(std::string key, std::string value);

    std::size_t
    size() const
    {
        return entries_.size();
    }

    std::size_t
    write_count() const
    {
        return write_count_;
    }

    const std::vector<std::pair<std::string, std::string>>&
    compactions() const
    {
        return compactions_;
    }

private:
    std::map<std::string, std::string, std::less<>> entries_;
    std::size_t write_count_ = 0;
    std::vector<std::pair<std::string, std::string>> compactions_;
};

}  // namespace cpak::store
