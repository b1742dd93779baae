#pragma once

#include "Types.hpp"
#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace core {

/**
 * Recorded landmark stream for offline runs.
 *
 * Text format, one tick per line:
 *   <t_ms> x0 y0 z0 x1 y1 z1 ... x20 y20 z20   hand present (pixel coords)
 *   <t_ms>                                     no hand this tick
 *   # comment / blank line                     ignored
 * Timestamps are offsets from the start of the recording and must not decrease.
 */
class LandmarkReplay {
public:
    struct Entry {
        std::chrono::milliseconds offset{0};
        std::optional<std::vector<Landmark>> landmarks;  // Empty = no hand
    };

    /**
     * Load a recording from disk.
     * @return false if the file cannot be opened or holds no valid entries
     */
    bool load(const std::string& path);

    /**
     * Parse a recording from any stream. Bad lines are skipped with a warning.
     * @return Number of entries read
     */
    size_t read(std::istream& input);

    /**
     * Parse a single line.
     * @return std::nullopt for comments, blank lines and malformed lines
     *         (`error` is set for the latter)
     */
    [[nodiscard]] static std::optional<Entry> parseLine(const std::string& line, std::string& error);

    /**
     * Materialize entry `i` as a frame anchored at `start`
     */
    [[nodiscard]] LandmarkFrame frameAt(size_t i, std::chrono::steady_clock::time_point start) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] size_t skippedLines() const { return skippedLines_; }

private:
    std::vector<Entry> entries_;
    size_t skippedLines_ = 0;
};

} // namespace core
