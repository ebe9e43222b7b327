#pragma once

#include "database.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace postrelay::storage {

// Last confirmed byte offset per resumable session, kept as one JSON object
// under a single well-known key of the kv_store table.
class OffsetStore {
public:
    static constexpr const char* DEFAULT_STORAGE_KEY = "postrelay.level3.uploadOffsets";

    explicit OffsetStore(Database& db, std::string storage_key = DEFAULT_STORAGE_KEY);

    void initialize();

    // Zero when nothing was recorded for the session.
    uint64_t offset(const std::string& session_id);
    void set(const std::string& session_id, uint64_t offset);
    void clear(const std::string& session_id);

    std::map<std::string, uint64_t> all();

private:
    Database& db_;
    std::string storage_key_;

    std::map<std::string, uint64_t> load_offsets();
    void save_offsets(const std::map<std::string, uint64_t>& offsets);
};

}
