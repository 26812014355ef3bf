#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace revkit {

struct Field {
    std::string key;
    std::string value;
    size_t line = 0;
};

// A block of key=value lines opened by one of the reader's leader keys.
struct Record {
    std::string kind;   // leader key that opened the record ("id", "goal", "module")
    std::string name;   // value of the leader line
    size_t line = 0;
    std::vector<Field> fields; // excludes the leader line

    const Field* get(const std::string& key) const; // last occurrence
    std::vector<std::string> get_all(const std::string& key) const;
};

struct RecordDocument {
    std::string source;
    std::vector<Field> header; // key=value lines before the first leader
    std::vector<Record> records;

    const Field* header_get(const std::string& key) const;
};

// Parser for the line-oriented key=value files used for manifests, plans and
// sessions: '#' comments, blank lines ignored, a leader key starts a record.
class RecordReader {
public:
    explicit RecordReader(std::vector<std::string> leader_keys) : leaders_(std::move(leader_keys)) {}

    RecordDocument parse(const std::string& text, const std::string& source) const; // throws FormatError
    RecordDocument parse_file(const std::string& path) const; // throws Error if unreadable

    static constexpr size_t kMaxLineLength = 4096;

private:
    bool is_leader(const std::string& key) const;
    std::vector<std::string> leaders_;
};

}
