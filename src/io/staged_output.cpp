#include "io/staged_output.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace scrambler {

StagedOutput::StagedOutput(std::string destination)
    : destination_(std::move(destination)),
      staging_path_(destination_ + ".partial") {
    stream_.open(staging_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!stream_.is_open()) {
        throw std::runtime_error("Failed to create output file: " + staging_path_);
    }
}

StagedOutput::~StagedOutput() {
    if (!committed_) {
        discard();
    }
}

bool StagedOutput::commit() {
    if (committed_) return true;

    stream_.flush();
    const bool written = stream_.good();
    stream_.close();
    if (!written || stream_.fail()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(staging_path_, destination_, ec);
    if (ec) {
        return false;
    }
    committed_ = true;
    return true;
}

void StagedOutput::discard() {
    if (stream_.is_open()) {
        stream_.close();
    }
    std::error_code ec;
    std::filesystem::remove(staging_path_, ec);
}

} // namespace scrambler
