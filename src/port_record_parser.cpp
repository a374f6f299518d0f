#include "port_record_parser.hpp"
#include <charconv>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace ports {

namespace {

constexpr size_t kMinTabularColumns = 9;

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

template <typename T>
std::optional<T> parse_number(const std::string& s) {
    T value{};
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || s.empty()) {
        return std::nullopt;
    }
    return value;
}

// "address:port", split on the last colon so IPv6 addresses survive
std::optional<ListeningPortRecord> parse_name_field(const std::string& name, int32_t pid,
                                                    const std::string& command) {
    std::string trimmed = trim(name);
    auto colon = trimmed.rfind(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    auto port = parse_number<uint16_t>(trim(trimmed.substr(colon + 1)));
    if (!port) {
        return std::nullopt;
    }

    ListeningPortRecord rec;
    rec.port = *port;
    rec.pid = pid;
    rec.process_name = command.empty() ? "unknown" : command;
    rec.address = trim(trimmed.substr(0, colon));
    return rec;
}

// Keeps first-seen order and drops repeated ports
class RecordCollector {
public:
    void add(std::optional<ListeningPortRecord> rec) {
        if (!rec || !seen_.insert(rec->port).second) {
            return;
        }
        records_.push_back(std::move(*rec));
    }

    std::vector<ListeningPortRecord> take() { return std::move(records_); }

private:
    std::unordered_set<uint16_t> seen_;
    std::vector<ListeningPortRecord> records_;
};

// State machine over lsof -F fields: p (pid) -> c (command) -> n (name)*
class FieldParser {
public:
    explicit FieldParser(RecordCollector& out) : out_(out) {}

    void feed(const std::string& line) {
        if (line.empty()) return;
        std::string value = line.substr(1);

        switch (line[0]) {
            case 'p':
                pid_ = parse_number<int32_t>(trim(value));
                command_.clear();
                break;
            case 'c':
                command_ = value;
                break;
            case 'n':
                if (pid_) {
                    out_.add(parse_name_field(value, *pid_, command_));
                }
                break;
            default:
                break;
        }
    }

private:
    RecordCollector& out_;
    std::optional<int32_t> pid_;
    std::string command_;
};

std::vector<std::string> split_lines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

} // namespace

std::vector<ListeningPortRecord> parse_field_output(const std::string& output) {
    RecordCollector records;
    FieldParser parser(records);
    for (const auto& line : split_lines(output)) {
        parser.feed(line);
    }
    return records.take();
}

std::vector<ListeningPortRecord> parse_tabular_output(const std::string& output) {
    RecordCollector records;
    for (const auto& line : split_lines(output)) {
        std::istringstream iss(line);
        std::vector<std::string> cols;
        std::string col;
        while (iss >> col) {
            cols.push_back(col);
        }
        if (cols.size() < kMinTabularColumns || cols[0] == "COMMAND") {
            continue;
        }

        auto pid = parse_number<int32_t>(cols[1]);
        if (!pid) {
            continue;
        }
        const std::string& name = cols.back() == "(LISTEN)" ? cols[cols.size() - 2] : cols.back();
        records.add(parse_name_field(name, *pid, cols[0]));
    }
    return records.take();
}

std::vector<ListeningPortRecord> parse_listening_ports(const std::string& output) {
    auto first = output.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && output.compare(first, 7, "COMMAND") == 0) {
        return parse_tabular_output(output);
    }
    return parse_field_output(output);
}

} // namespace ports
