#include "CSVUtils.h"

#include <unordered_set>

namespace {
std::string trimUnquoted(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

class RecordParser {
public:
    RecordParser(std::istream& is, char delimiter, const CSVUtils::ParseLimits& limits, CSVUtils::RecordStatus& status)
        : is_(is), delimiter_(delimiter), limits_(limits), status_(status) {}

    bool parse(std::vector<std::string>& fields);

private:
    bool charge(size_t bytes);
    bool appendToField(char c);
    void finishField(std::vector<std::string>& fields);
    bool consumeLineBreak(char c);

    std::istream& is_;
    char delimiter_;
    const CSVUtils::ParseLimits& limits_;
    CSVUtils::RecordStatus& status_;

    std::string field_;
    bool fieldQuoted_ = false;
    bool inQuotes_ = false;
    bool sawContent_ = false;
    size_t recordBytes_ = 0;
};

bool RecordParser::charge(size_t bytes) {
    if (limits_.maxRecordBytes > 0 && recordBytes_ + bytes > limits_.maxRecordBytes) {
        status_.limitExceeded = true;
        return false;
    }
    recordBytes_ += bytes;
    return true;
}

bool RecordParser::appendToField(char c) {
    field_.push_back(c);
    if (limits_.maxFieldBytes > 0 && field_.size() > limits_.maxFieldBytes) {
        status_.limitExceeded = true;
        return false;
    }
    return true;
}

void RecordParser::finishField(std::vector<std::string>& fields) {
    fields.push_back(fieldQuoted_ ? field_ : trimUnquoted(field_));
    field_.clear();
    fieldQuoted_ = false;
    if (limits_.maxColumns > 0 && fields.size() > limits_.maxColumns) status_.limitExceeded = true;
}

// Returns true when the line break ends the record.
bool RecordParser::consumeLineBreak(char c) {
    if (c == '\r' && is_.peek() == '\n') is_.get();
    ++status_.physicalLines;
    if (!inQuotes_) return true;
    if (limits_.maxPhysicalLinesPerRecord > 0 && status_.physicalLines >= limits_.maxPhysicalLinesPerRecord) {
        status_.limitExceeded = true;
        return true;
    }
    appendToField('\n');
    return false;
}

bool RecordParser::parse(std::vector<std::string>& fields) {
    fields.clear();
    if (is_.peek() == EOF) return false;

    char c;
    while (!status_.limitExceeded && is_.get(c)) {
        if (!charge(1)) break;

        if (inQuotes_) {
            if (c == '"') {
                if (is_.peek() == '"') {
                    is_.get();
                    appendToField('"');
                    continue;
                }
                const int next = is_.peek();
                if (next == EOF || next == delimiter_ || next == '\n' || next == '\r') {
                    inQuotes_ = false;
                } else {
                    appendToField(c);
                }
            } else if (c == '\n' || c == '\r') {
                if (consumeLineBreak(c)) break;
            } else {
                appendToField(c);
            }
            continue;
        }

        if (c == '"' && trimUnquoted(field_).empty() && !fieldQuoted_) {
            field_.clear();
            inQuotes_ = true;
            fieldQuoted_ = true;
            sawContent_ = true;
        } else if (c == delimiter_) {
            finishField(fields);
            sawContent_ = true;
        } else if (c == '\n' || c == '\r') {
            consumeLineBreak(c);
            break;
        } else {
            appendToField(c);
            sawContent_ = true;
        }
    }

    if (inQuotes_) status_.malformed = true;
    if (sawContent_ || !field_.empty()) finishField(fields);

    // A line holding only whitespace counts as blank.
    if (fields.size() == 1 && fields[0].empty() && !fieldQuoted_ && !sawContent_) fields.clear();
    return true;
}
} // namespace

namespace CSVUtils {

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) is.unget();
}

bool readRecord(std::istream& is,
                char delimiter,
                std::vector<std::string>& fields,
                RecordStatus* status,
                const ParseLimits& limits) {
    RecordStatus local;
    RecordStatus& out = status ? *status : local;
    out = RecordStatus{};
    RecordParser parser(is, delimiter, limits, out);
    return parser.parse(fields);
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = header[i].empty() ? "column_" + std::to_string(i + 1) : header[i];
        const std::string base = name;
        for (size_t suffix = 2; seen.count(name) > 0; ++suffix) {
            name = base + "_" + std::to_string(suffix);
        }
        seen.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool edgeSpace = !value.empty() && (value.front() == ' ' || value.back() == ' ' ||
                                              value.front() == '\t' || value.back() == '\t');
    const bool needsQuotes = edgeSpace || value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos;
    if (!needsQuotes) return value;

    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace CSVUtils
