#include "core/LandmarkReplay.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <sstream>

namespace core {

bool LandmarkReplay::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::error("LandmarkReplay: cannot open ", path);
        return false;
    }

    size_t count = read(file);
    if (count == 0) {
        Logger::error("LandmarkReplay: no usable entries in ", path);
        return false;
    }

    Logger::info("LandmarkReplay: loaded ", count, " ticks from ", path,
                 " (", skippedLines_, " lines skipped)");
    return true;
}

size_t LandmarkReplay::read(std::istream& input) {
    entries_.clear();
    skippedLines_ = 0;

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(input, line)) {
        lineNumber++;

        std::string error;
        std::optional<Entry> entry = parseLine(line, error);
        if (!entry) {
            if (!error.empty()) {
                Logger::warn("LandmarkReplay: line ", lineNumber, ": ", error);
                skippedLines_++;
            }
            continue;
        }

        if (!entries_.empty() && entry->offset < entries_.back().offset) {
            Logger::warn("LandmarkReplay: line ", lineNumber, ": timestamp goes backwards, skipped");
            skippedLines_++;
            continue;
        }

        entries_.push_back(std::move(*entry));
    }

    return entries_.size();
}

std::optional<LandmarkReplay::Entry> LandmarkReplay::parseLine(const std::string& line, std::string& error) {
    error.clear();

    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
        return std::nullopt;
    }

    std::istringstream ss(line);
    long long offsetMs = 0;
    if (!(ss >> offsetMs) || offsetMs < 0) {
        error = "missing or negative timestamp";
        return std::nullopt;
    }

    std::vector<float> values;
    float v = 0.0f;
    while (ss >> v) {
        values.push_back(v);
    }
    if (!ss.eof()) {
        error = "non-numeric coordinate";
        return std::nullopt;
    }
    if (values.size() % 3 != 0) {
        error = "coordinate count " + std::to_string(values.size()) + " is not a multiple of 3";
        return std::nullopt;
    }

    Entry entry;
    entry.offset = std::chrono::milliseconds(offsetMs);
    if (!values.empty()) {
        // Short frames are kept: the controller degrades them to "no hand"
        std::vector<Landmark> landmarks;
        landmarks.reserve(values.size() / 3);
        for (size_t i = 0; i < values.size(); i += 3) {
            landmarks.push_back({values[i], values[i + 1], values[i + 2]});
        }
        entry.landmarks = std::move(landmarks);
    }
    return entry;
}

LandmarkFrame LandmarkReplay::frameAt(size_t i, std::chrono::steady_clock::time_point start) const {
    const Entry& entry = entries_.at(i);
    LandmarkFrame frame;
    frame.timestamp = start + entry.offset;
    if (entry.landmarks) {
        frame.landmarks = *entry.landmarks;
    }
    return frame;
}

} // namespace core
