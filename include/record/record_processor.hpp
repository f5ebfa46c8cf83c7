#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "record/delimited_codec.hpp"
#include "scramble/range_selector.hpp"
#include "scramble/scramble_strategy.hpp"

#include <atomic>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scrambler {

/**
 * @brief Streams records from input to output, scrambling the selection
 *
 * Records are handled strictly one at a time in input order. Record 0 is
 * copied unchanged when the request declares a header. Processing stops at
 * the first failure; anything already written to the output stays there and
 * belongs to the caller.
 */
class RecordProcessor {
public:
    RecordProcessor(const ScrambleRequest& request,
                    ScrambleStrategy& strategy,
                    const std::atomic<bool>* cancel_flag)
        : request_(request),
          strategy_(strategy),
          selector_(request.start_pos, request.end_pos),
          cancel_flag_(cancel_flag) {}

    virtual ~RecordProcessor() = default;

    [[nodiscard]] virtual Result<RunStats> process(std::istream& in, std::ostream& out) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;

protected:
    [[nodiscard]] bool cancelled() const {
        return cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_header(size_t index) const {
        return index == 0 && request_.has_header;
    }

    const ScrambleRequest& request_;
    ScrambleStrategy& strategy_;
    RangeSelector selector_;
    const std::atomic<bool>* cancel_flag_;
};

/**
 * @brief Free-text records: a character range of every line
 */
class LineProcessor final : public RecordProcessor {
public:
    using RecordProcessor::RecordProcessor;

    [[nodiscard]] Result<RunStats> process(std::istream& in, std::ostream& out) override;

    [[nodiscard]] std::string_view name() const override { return "line"; }

    /**
     * @brief Scramble one line (no terminator), ignoring the header rule
     * @param[out] scrambled false when the line was too short to select from
     */
    [[nodiscard]] std::string scramble_line(std::string_view line, bool& scrambled);
};

/**
 * @brief Delimited rows: one whole column of every row
 */
class DelimitedProcessor final : public RecordProcessor {
public:
    DelimitedProcessor(const ScrambleRequest& request,
                       ScrambleStrategy& strategy,
                       const std::atomic<bool>* cancel_flag,
                       DelimitedDialect dialect)
        : RecordProcessor(request, strategy, cancel_flag),
          dialect_(std::move(dialect)) {}

    [[nodiscard]] Result<RunStats> process(std::istream& in, std::ostream& out) override;

    [[nodiscard]] std::string_view name() const override { return "delimited"; }

    /**
     * @brief Scramble the selected field of a row in place, ignoring the header rule
     * @return false when the row has no such column
     */
    bool scramble_row(std::vector<std::string>& fields);

private:
    DelimitedDialect dialect_;
};

[[nodiscard]] std::unique_ptr<RecordProcessor> make_record_processor(
    const ScrambleRequest& request,
    ScrambleStrategy& strategy,
    const DelimitedDialect& dialect,
    const std::atomic<bool>* cancel_flag = nullptr);

} // namespace scrambler
