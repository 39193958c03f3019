#include "stockledger/checkpoint.hpp"
#include "stockledger/errors.hpp"

#include <filesystem>
#include <fstream>

namespace stockledger {
namespace checkpoint {

void write(const std::string& path, const ProjectionCheckpoint& checkpoint) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out || !checkpoint.SerializeToOstream(&out)) {
            throw StorageError("cannot write checkpoint " + tmp);
        }
        out.flush();
        if (!out) {
            throw StorageError("cannot flush checkpoint " + tmp);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw StorageError("cannot install checkpoint " + path + ": " + ec.message());
    }
}

std::optional<ProjectionCheckpoint> read(const std::string& path) {
    if (!std::filesystem::exists(path)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    ProjectionCheckpoint checkpoint;
    if (!in || !checkpoint.ParseFromIstream(&in)) {
        throw StorageError("cannot parse checkpoint " + path);
    }
    return checkpoint;
}

} // namespace checkpoint
} // namespace stockledger
