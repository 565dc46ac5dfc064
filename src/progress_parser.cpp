#include "progress_parser.hpp"
#include <cctype>
#include <vector>

namespace protonsync {

namespace {

const char* const TRANSFERRED_PREFIX = "Transferred:";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = s.find(',', start);
        fields.push_back(trim(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return fields;
}

} // namespace

std::string TransferProgress::summary() const {
    std::string text = transferred + " of " + total + " (" + std::to_string(percent) + "%)";
    if (!speed.empty()) {
        text += ", " + speed;
    }
    if (!eta.empty() && eta != "-") {
        text += ", ETA " + eta;
    }
    return text;
}

std::optional<TransferProgress> parse_progress_line(const std::string& line) {
    std::string text = trim(line);
    if (text.compare(0, std::string(TRANSFERRED_PREFIX).size(), TRANSFERRED_PREFIX) != 0) {
        return std::nullopt;
    }
    text = text.substr(std::string(TRANSFERRED_PREFIX).size());

    // done / total, pct%, speed, ETA eta
    std::vector<std::string> fields = split_fields(text);
    if (fields.size() < 4) {
        return std::nullopt;
    }

    size_t slash = fields[0].find(" / ");
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    const std::string& pct = fields[1];
    if (pct.empty() || pct.back() != '%') {
        return std::nullopt;
    }
    // rclone never prints more than "100%"
    if (pct.size() > 4) {
        return std::nullopt;
    }
    int percent = 0;
    for (size_t i = 0; i + 1 < pct.size(); ++i) {
        if (!isdigit(static_cast<unsigned char>(pct[i]))) {
            return std::nullopt;
        }
        percent = percent * 10 + (pct[i] - '0');
    }

    TransferProgress progress;
    progress.transferred = trim(fields[0].substr(0, slash));
    progress.total = trim(fields[0].substr(slash + 3));
    progress.percent = percent > 100 ? 100 : percent;
    progress.speed = fields[2];

    const std::string& eta = fields[3];
    if (eta.compare(0, 3, "ETA") == 0) {
        progress.eta = trim(eta.substr(3));
    } else {
        progress.eta = eta;
    }
    return progress;
}

} // namespace protonsync
