#pragma once

#include <filesystem>

#include "core/contracts/IStateStore.h"

namespace tradebrain {
namespace core {

// One JSON document per file. The payload keys sit at the top level next to
// schema_version and saved_at_ms. Writes go to "<file>.tmp" and are renamed over.
class JsonStateStore : public IStateStore {
public:
    explicit JsonStateStore(std::filesystem::path file_path);

    StateLoadResult load() override;
    StateSaveResult save(const StateSnapshot& snapshot) override;
    std::string describe() const override { return file_path_.string(); }

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace tradebrain
