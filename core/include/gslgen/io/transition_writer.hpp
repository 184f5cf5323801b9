#pragma once

#include "../engine.hpp"
#include "../errors.hpp"
#include "../transition.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace gslgen {
namespace io {

/**
 * @brief Exception thrown when a transition list cannot be written.
 */
class WriteError : public Error {
public:
    explicit WriteError(const std::string& msg)
        : Error("write error: " + msg) {}
};

/**
 * @brief Options for transition list output.
 */
struct TransitionWriterOptions {
    /// Field delimiter
    char delimiter = ',';

    /// Decimal places of m/z columns
    int precision = 4;

    /// Leave all m/z columns empty (the importing software recomputes them)
    bool blank_mz = false;

    /// Emit the header row before the first record
    bool write_header = true;
};

/// Column names of a transition list, in output order
const std::vector<std::string>& transitionColumns();

/**
 * @brief Writes transition records as delimited text.
 *
 * Fields holding the delimiter, a quote or a line break are quoted, with
 * embedded quotes doubled. m/z values are rounded here and nowhere else.
 *
 * Usage:
 * @code
 * TransitionWriter writer(std::cout);
 * writer.write(stream);
 * @endcode
 */
class TransitionWriter {
public:
    explicit TransitionWriter(std::ostream& out, TransitionWriterOptions options = {});

    /// Write the header row (once; later calls do nothing)
    void writeHeader();

    /// Write one record (header first if pending)
    void write(const TransitionRecord& record);

    /// Write a batch of records
    void write(const std::vector<TransitionRecord>& records);

    /**
     * @brief Drain a stream into the output.
     *
     * @return Number of records written
     */
    std::size_t write(TransitionStream& stream);

    [[nodiscard]] std::size_t rowsWritten() const noexcept { return rows_; }

    [[nodiscard]] const TransitionWriterOptions& options() const noexcept { return options_; }

private:
    std::string field(const std::string& value) const;
    std::string mzField(MZ value) const;
    void writeRow(const std::vector<std::string>& fields);

    std::ostream* out_;
    TransitionWriterOptions options_;
    bool header_written_ = false;
    std::size_t rows_ = 0;
};

/**
 * @brief Write records to a file.
 *
 * @throws WriteError if the file cannot be opened or written
 */
void writeTransitions(const std::string& filename,
                      const std::vector<TransitionRecord>& records,
                      const TransitionWriterOptions& options = {});

} // namespace io
} // namespace gslgen
