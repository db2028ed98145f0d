#include "core/state/JsonStateStore.h"

#include <fstream>
#include <system_error>

namespace tradebrain {
namespace core {

const char* toString(StateStoreStatus status) {
    switch (status) {
        case StateStoreStatus::OK: return "OK";
        case StateStoreStatus::NOT_FOUND: return "NOT_FOUND";
        case StateStoreStatus::PARSE_ERROR: return "PARSE_ERROR";
        case StateStoreStatus::IO_ERROR: return "IO_ERROR";
    }
    return "IO_ERROR";
}

JsonStateStore::JsonStateStore(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

StateLoadResult JsonStateStore::load() {
    StateLoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        result.status = StateStoreStatus::NOT_FOUND;
        result.message = "no snapshot at " + file_path_.string();
        return result;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        result.status = StateStoreStatus::IO_ERROR;
        result.message = "cannot open " + file_path_.string();
        return result;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::parse_error& e) {
        result.status = StateStoreStatus::PARSE_ERROR;
        result.message = e.what();
        return result;
    }

    if (!raw.is_object()) {
        result.status = StateStoreStatus::PARSE_ERROR;
        result.message = "snapshot root is not an object";
        return result;
    }

    StateSnapshot snapshot;
    try {
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
    } catch (const nlohmann::json::type_error& e) {
        result.status = StateStoreStatus::PARSE_ERROR;
        result.message = e.what();
        return result;
    }
    raw.erase("schema_version");
    raw.erase("saved_at_ms");
    snapshot.payload = std::move(raw);

    result.status = StateStoreStatus::OK;
    result.snapshot = std::move(snapshot);
    return result;
}

StateSaveResult JsonStateStore::save(const StateSnapshot& snapshot) {
    StateSaveResult result;

    nlohmann::json raw = snapshot.payload.is_object() ? snapshot.payload : nlohmann::json::object();
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            result.status = StateStoreStatus::IO_ERROR;
            result.message = "cannot create " + file_path_.parent_path().string() + ": " + ec.message();
            return result;
        }
    }

    // Trade labels arrive unvalidated; invalid UTF-8 is written as U+FFFD.
    std::string body;
    try {
        body = raw.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        result.status = StateStoreStatus::IO_ERROR;
        result.message = "cannot serialize snapshot for " + file_path_.string() + ": " + e.what();
        return result;
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.status = StateStoreStatus::IO_ERROR;
            result.message = "cannot open " + tmp_path.string();
            return result;
        }
        out << body;
        out.flush();
        if (!out) {
            result.status = StateStoreStatus::IO_ERROR;
            result.message = "write failed for " + tmp_path.string();
            return result;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return result;
    }

    // Rename over an existing file can fail on some filesystems; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        result.status = StateStoreStatus::IO_ERROR;
        result.message = "cannot replace " + file_path_.string() + ": " + ec.message();
        return result;
    }

    std::filesystem::remove(tmp_path, ec);
    return result;
}

} // namespace core
} // namespace tradebrain
