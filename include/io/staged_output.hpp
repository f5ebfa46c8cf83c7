#pragma once

#include <fstream>
#include <string>

namespace scrambler {

/**
 * @brief Output file written beside its destination and renamed on commit
 *
 * Data goes to "<destination>.partial". commit() flushes, closes and renames
 * it over the destination. If the object is destroyed without a successful
 * commit the staging file is removed, so a failed run leaves no artifact.
 */
class StagedOutput {
public:
    /// @throws std::runtime_error if the staging file cannot be created
    explicit StagedOutput(std::string destination);
    ~StagedOutput();

    StagedOutput(const StagedOutput&) = delete;
    StagedOutput& operator=(const StagedOutput&) = delete;

    [[nodiscard]] std::ostream& stream() { return stream_; }

    /// Returns false (and keeps the destination untouched) if the commit fails
    [[nodiscard]] bool commit();

    /// Close and delete the staging file
    void discard();

    [[nodiscard]] const std::string& staging_path() const { return staging_path_; }
    [[nodiscard]] bool committed() const { return committed_; }

private:
    std::string destination_;
    std::string staging_path_;
    std::ofstream stream_;
    bool committed_ = false;
};

} // namespace scrambler
