#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "record/delimited_codec.hpp"
#include "scramble/random_source.hpp"

#include <atomic>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace scrambler {

/**
 * @brief Validates a ScrambleRequest and drives it over a record stream
 *
 * Validation failures are reported before any record is read or written.
 * Runtime failures carry the index of the offending record and stop the run.
 * The engine holds no state between runs apart from the injected random
 * source, which is one logical stream for its whole lifetime.
 */
class ScrambleEngine {
public:
    struct Options {
        DelimitedDialect dialect;
        const std::atomic<bool>* cancel_flag = nullptr;   // Checked between records
    };

    explicit ScrambleEngine(IRandomSource& rng);
    ScrambleEngine(IRandomSource& rng, Options options);

    /**
     * @brief Check a request before processing
     * @return The first violation found, or std::nullopt when the request is valid
     */
    [[nodiscard]] static std::optional<ScrambleError> validate(const ScrambleRequest& request);

    /**
     * @brief Scramble from a stream to a stream
     *
     * On a mid-stream failure the records written so far remain in out.
     */
    [[nodiscard]] Result<RunStats> run(const ScrambleRequest& request,
                                       std::istream& in,
                                       std::ostream& out);

    /**
     * @brief Scramble a file into output_path, committing atomically
     *
     * The output is staged next to output_path and renamed into place only
     * after every record succeeded. No file is created on validation failure
     * and the staging file is removed on any later failure.
     */
    [[nodiscard]] Result<RunStats> run_file(const ScrambleRequest& request,
                                            const std::string& input_path,
                                            const std::string& output_path);

private:
    IRandomSource& rng_;
    Options options_;
};

} // namespace scrambler
