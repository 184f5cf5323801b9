#include "gslgen/io/transition_writer.hpp"
#include "gslgen/log.hpp"
#include <fmt/format.h>
#include <fstream>
#include <ostream>

namespace gslgen {
namespace io {

const std::vector<std::string>& transitionColumns() {
    static const std::vector<std::string> columns = {
        "Molecule List Name",
        "Molecule",
        "Molecule Formula",
        "Precursor Adduct",
        "Precursor m/z",
        "Precursor Charge",
        "Product Name",
        "Product Formula",
        "Product m/z",
        "Product Charge",
        "Label",
    };
    return columns;
}

TransitionWriter::TransitionWriter(std::ostream& out, TransitionWriterOptions options)
    : out_(&out), options_(options) {}

std::string TransitionWriter::field(const std::string& value) const {
    const bool needs_quotes = value.find(options_.delimiter) != std::string::npos ||
                              value.find_first_of("\"\r\n") != std::string::npos;
    if (!needs_quotes) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string TransitionWriter::mzField(MZ value) const {
    if (options_.blank_mz) {
        return "";
    }
    return fmt::format("{:.{}f}", value, options_.precision);
}

void TransitionWriter::writeRow(const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            *out_ << options_.delimiter;
        }
        *out_ << field(fields[i]);
    }
    *out_ << '\n';
}

void TransitionWriter::writeHeader() {
    if (header_written_) {
        return;
    }
    writeRow(transitionColumns());
    header_written_ = true;
}

void TransitionWriter::write(const TransitionRecord& record) {
    if (options_.write_header && !header_written_) {
        writeHeader();
    }

    writeRow({
        record.molecule_list_name,
        record.molecule,
        record.molecule_formula,
        record.precursor_adduct,
        mzField(record.precursor_mz),
        std::to_string(record.precursor_charge),
        record.product_name,
        record.product_formula,
        mzField(record.product_mz),
        std::to_string(record.product_charge),
        toString(record.label),
    });
    ++rows_;
}

void TransitionWriter::write(const std::vector<TransitionRecord>& records) {
    for (const auto& record : records) {
        write(record);
    }
}

std::size_t TransitionWriter::write(TransitionStream& stream) {
    std::size_t written = 0;
    while (auto record = stream.next()) {
        write(*record);
        ++written;
    }
    return written;
}

void writeTransitions(const std::string& filename,
                      const std::vector<TransitionRecord>& records,
                      const TransitionWriterOptions& options) {
    std::ofstream file(filename);
    if (!file) {
        throw WriteError("failed to open " + filename);
    }

    TransitionWriter writer(file, options);
    if (options.write_header) {
        writer.writeHeader();
    }
    writer.write(records);

    file.flush();
    if (!file) {
        throw WriteError("failed to write " + filename);
    }
    log::info("Wrote {} transitions to {}", writer.rowsWritten(), filename);
}

} // namespace io
} // namespace gslgen
