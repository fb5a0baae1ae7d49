#include "declist/corpus_io.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <zlib.h>

namespace declist {

// Large I/O buffer for zlib and output streams
constexpr size_t IOBUF_SIZE = 1024 * 1024;

namespace {

bool is_gzip(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return false;
    unsigned char magic[2] = {0, 0};
    bool gz = (fread(magic, 1, 2, f) == 2) &&
              (magic[0] == 0x1f && magic[1] == 0x8b);
    fclose(f);
    return gz;
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (!is_space(c)) return false;
    }
    return true;
}

// Next whitespace-delimited field starting at pos; pos ends just past it
std::string_view next_field(std::string_view line, size_t& pos) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    const size_t begin = pos;
    while (pos < line.size() && !is_space(line[pos])) ++pos;
    return line.substr(begin, pos - begin);
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string location(const LineReader& reader) {
    return reader.filename() + ":" + std::to_string(reader.line_number());
}

}  // namespace

// LineReader implementation
class LineReader::Impl {
public:
    std::string filename_;
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    size_t line_number_ = 0;
    char buffer_[65536];

    bool open(const std::string& filename) {
        filename_ = filename;
        if (is_gzip(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, static_cast<unsigned>(IOBUF_SIZE));
            return true;
        }
        file_.open(filename);
        return static_cast<bool>(file_);
    }

    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (std::getline(file_, line)) return true;
            if (file_.bad()) {
                throw std::runtime_error("Read error in file: " + filename_);
            }
            return false;
        }

        // gzgets stops at the buffer size, so long lines arrive in pieces
        line.clear();
        while (true) {
            if (!gzgets(gz_file_, buffer_, sizeof(buffer_))) {
                int err = Z_OK;
                const char* msg = gzerror(gz_file_, &err);
                if (err != Z_OK && err != Z_STREAM_END) {
                    throw std::runtime_error("Read error in file: " + filename_ + " (" + msg + ")");
                }
                return !line.empty();
            }
            line.append(buffer_, strlen(buffer_));
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
                return true;
            }
        }
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) {
            file_.close();
        }
    }

    ~Impl() {
        close();
    }
};

LineReader::LineReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

LineReader::~LineReader() = default;

bool LineReader::read_line(std::string& line) {
    if (!impl_->getline(line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    ++impl_->line_number_;
    return true;
}

size_t LineReader::line_number() const {
    return impl_->line_number_;
}

const std::string& LineReader::filename() const {
    return impl_->filename_;
}

bool LineReader::is_gzipped() const {
    return impl_->is_gzipped_;
}

// OutputFile implementation
class OutputFile::Impl {
public:
    std::string filename_;
    std::ofstream file_;
    std::unique_ptr<char[]> buffer_ = std::make_unique<char[]>(IOBUF_SIZE);
};

OutputFile::OutputFile(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->filename_ = filename;
    impl_->file_.rdbuf()->pubsetbuf(impl_->buffer_.get(), IOBUF_SIZE);
    impl_->file_.open(filename);
    if (!impl_->file_) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
}

OutputFile::~OutputFile() {
    if (impl_ && impl_->file_.is_open()) {
        impl_->file_.close();
    }
}

std::ostream& OutputFile::stream() {
    return impl_->file_;
}

void OutputFile::close() {
    if (!impl_->file_.is_open()) return;
    impl_->file_.flush();
    const bool ok = impl_->file_.good();
    impl_->file_.close();
    if (!ok || impl_->file_.fail()) {
        throw std::runtime_error("Failed to write output file: " + impl_->filename_);
    }
}

// Parsers

bool parse_training_line(std::string_view line, LabeledDocument& out) {
    size_t pos = 0;
    const std::string_view id = next_field(line, pos);
    const std::string_view cls = next_field(line, pos);
    if (id.empty() || (cls != "0" && cls != "1")) {
        return false;
    }
    // One separator between the class and the text
    if (pos < line.size()) ++pos;

    out.id.assign(id);
    out.positive = (cls == "1");
    out.text.assign(line.substr(pos));
    return true;
}

bool parse_test_line(std::string_view line, Document& out) {
    size_t pos = 0;
    const std::string_view id = next_field(line, pos);
    const std::string_view marker = next_field(line, pos);
    if (id.empty() || marker != "__") {
        return false;
    }
    if (pos < line.size()) ++pos;

    out.id.assign(id);
    out.text.assign(line.substr(pos));
    return true;
}

bool parse_label_line(std::string_view line, std::string& id, bool& positive) {
    const std::string_view body = trim(line);
    size_t split = body.size();
    while (split > 0 && !is_space(body[split - 1])) --split;
    if (split == 0) return false;

    const std::string_view cls = body.substr(split);
    const std::string_view id_part = trim(body.substr(0, split));
    if (id_part.empty() || (cls != "0" && cls != "1")) {
        return false;
    }
    id.assign(id_part);
    positive = (cls == "1");
    return true;
}

// File-level readers

void for_each_training_document(const std::string& filename,
                                const std::function<void(const LabeledDocument&)>& fn) {
    LineReader reader(filename);
    std::string line;
    LabeledDocument doc;
    while (reader.read_line(line)) {
        if (is_blank(line)) continue;
        if (!parse_training_line(line, doc)) {
            throw std::runtime_error(location(reader) +
                                     ": malformed training line (expected '<id> <0|1> <text>')");
        }
        fn(doc);
    }
}

std::vector<Document> read_test_documents(const std::string& filename) {
    LineReader reader(filename);
    std::vector<Document> docs;
    std::unordered_set<std::string> ids;
    std::string line;
    Document doc;
    while (reader.read_line(line)) {
        if (is_blank(line)) continue;
        if (!parse_test_line(line, doc)) {
            throw std::runtime_error(location(reader) +
                                     ": malformed test line (expected '<id> __ <text>')");
        }
        if (!ids.insert(doc.id).second) {
            throw std::runtime_error(location(reader) + ": duplicate document id '" + doc.id + "'");
        }
        docs.push_back(doc);
    }
    return docs;
}

LabelSet read_label_file(const std::string& filename) {
    LineReader reader(filename);
    LabelSet labels;
    std::string line;
    std::string id;
    bool positive = false;
    while (reader.read_line(line)) {
        if (is_blank(line)) continue;
        if (!parse_label_line(line, id, positive)) {
            throw std::runtime_error(location(reader) +
                                     ": malformed label line (expected '<id> <0|1>')");
        }
        if (!labels.add(id, positive)) {
            throw std::runtime_error(location(reader) + ": duplicate document id '" + id + "'");
        }
    }
    return labels;
}

void write_labels(std::ostream& os, const LabelSet& labels) {
    for (const auto& [id, positive] : labels) {
        os << id << ' ' << label_char(positive) << '\n';
    }
}

void write_label_file(const std::string& filename, const LabelSet& labels) {
    OutputFile out(filename);
    write_labels(out.stream(), labels);
    out.close();
}

}  // namespace declist
