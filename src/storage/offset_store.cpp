#include "postrelay/storage/offset_store.hpp"
#include "postrelay/network/http_types.hpp"
#include "postrelay/network/wire.hpp"
#include "postrelay/core/logger.hpp"

namespace postrelay::storage {

namespace wire = postrelay::network::wire;

OffsetStore::OffsetStore(Database& db, std::string storage_key)
    : db_(db), storage_key_(std::move(storage_key)) {
}

void OffsetStore::initialize() {
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS kv_store (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )");
}

uint64_t OffsetStore::offset(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    auto offsets = load_offsets();
    auto it = offsets.find(session_id);
    return it != offsets.end() ? it->second : 0;
}

void OffsetStore::set(const std::string& session_id, uint64_t offset) {
    Transaction tx(db_);
    auto offsets = load_offsets();
    offsets[session_id] = offset;
    save_offsets(offsets);
    tx.commit();
    LOG_TRACE("Persisted offset {} for session {}", offset, session_id);
}

void OffsetStore::clear(const std::string& session_id) {
    Transaction tx(db_);
    auto offsets = load_offsets();
    if (offsets.erase(session_id) == 0) {
        return;
    }
    save_offsets(offsets);
    tx.commit();
}

std::map<std::string, uint64_t> OffsetStore::all() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    return load_offsets();
}

std::map<std::string, uint64_t> OffsetStore::load_offsets() {
    Statement stmt(db_, "SELECT value FROM kv_store WHERE key = ?;");
    stmt.bind(1, storage_key_);
    if (!stmt.step()) {
        return {};
    }

    std::map<std::string, uint64_t> offsets;
    try {
        auto root = wire::parse_json(stmt.column_text(0));
        if (!root.isObject()) {
            LOG_WARN("Ignoring malformed offset map under {}", storage_key_);
            return {};
        }
        for (const auto& session_id : root.getMemberNames()) {
            const auto& value = root[session_id];
            if (value.isUInt64()) {
                offsets[session_id] = value.asUInt64();
            }
        }
    } catch (const postrelay::network::WireFormatError& e) {
        LOG_WARN("Ignoring unreadable offset map under {}: {}", storage_key_, e.what());
        return {};
    }
    return offsets;
}

void OffsetStore::save_offsets(const std::map<std::string, uint64_t>& offsets) {
    Json::Value root(Json::objectValue);
    for (const auto& [session_id, offset] : offsets) {
        root[session_id] = Json::UInt64(offset);
    }

    Statement stmt(db_, "INSERT OR REPLACE INTO kv_store (key, value) VALUES (?, ?);");
    stmt.bind(1, storage_key_);
    stmt.bind(2, wire::to_json_string(root));
    stmt.execute();
}

}
