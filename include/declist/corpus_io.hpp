#pragma once

#include "declist/label_set.hpp"
#include "declist/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace declist {

/**
 * Line reader for corpus, decision-list and label files
 *
 * Supports:
 * - Uncompressed files
 * - gzip-compressed files (detected from the magic bytes, read via zlib)
 *
 * Lines are returned without the trailing newline or carriage return.
 */
class LineReader {
public:
    /**
     * Open a file; throws std::runtime_error if it cannot be read
     */
    explicit LineReader(const std::string& filename);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Read the next line. Returns false at end of file;
     * throws std::runtime_error on a read error.
     */
    bool read_line(std::string& line);

    // 1-based number of the line last returned
    size_t line_number() const;

    const std::string& filename() const;
    bool is_gzipped() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Buffered text output file
 */
class OutputFile {
public:
    /**
     * Create or truncate a file; throws std::runtime_error on failure
     */
    explicit OutputFile(const std::string& filename);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    std::ostream& stream();

    /**
     * Flush and close; throws std::runtime_error if any write failed
     */
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Line parsers. Each returns false if the line does not have the expected shape.

// "<id> <0|1> <text>"
bool parse_training_line(std::string_view line, LabeledDocument& out);

// "<id> __ <text>"
bool parse_test_line(std::string_view line, Document& out);

// "<id> <0|1>"
bool parse_label_line(std::string_view line, std::string& id, bool& positive);

/**
 * Stream a training corpus one document at a time.
 * Blank lines are skipped; a malformed line throws std::runtime_error
 * naming the file and line.
 */
void for_each_training_document(const std::string& filename,
                                const std::function<void(const LabeledDocument&)>& fn);

/**
 * Read a whole test corpus in file order. Duplicate ids are an error.
 */
std::vector<Document> read_test_documents(const std::string& filename);

/**
 * Read a label file ("<id> <0|1>" per line). Duplicate ids are an error.
 */
LabelSet read_label_file(const std::string& filename);

// One "<id> <0|1>" line per entry, in set order
void write_labels(std::ostream& os, const LabelSet& labels);
void write_label_file(const std::string& filename, const LabelSet& labels);

}  // namespace declist
