#pragma once
// include/minefield/scores/HighScores.hpp
//
// Bounded leaderboard of fastest winning times, persisted as JSON in the
// per-user data directory.
//
// Persistence never fails loudly: an unreadable or corrupt file is logged and
// treated as an empty list, and a failed save is logged and reported through
// the return value while the in-memory list stays as it was.

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace minefield::scores {

struct HighScoreEntry {
    std::string playerName;
    double      completionTime = 0.0; // seconds, lower is better
    std::string dateAchieved;         // ISO-8601 local time, e.g. 2024-05-01T18:22:03

    // Stamps the current local time.
    [[nodiscard]] static HighScoreEntry Create(std::string playerName, double completionTime);
};

// Current local time as YYYY-MM-DDTHH:MM:SS (empty on conversion failure).
[[nodiscard]] std::string CurrentIsoTimestamp();

class HighScoreManager {
public:
    static constexpr std::size_t kDefaultMaxScores = 10;

    // Loads whatever is at `file`; a missing file is an empty leaderboard.
    explicit HighScoreManager(std::filesystem::path file,
                              std::size_t maxScores = kDefaultMaxScores);

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return m_file; }
    [[nodiscard]] std::size_t maxScores() const noexcept { return m_maxScores; }

    // Re-reads the file, then inserts the entry if the list is not full or the
    // time beats the current worst entry. Returns true if the score qualified
    // (even when the subsequent save failed).
    bool addScore(const std::string& playerName, double completionTime);

    // Re-reads the file and reports whether `completionTime` would make the list.
    [[nodiscard]] bool qualifiesForHighScore(double completionTime);

    // Replaces the in-memory list with the file contents (sorted, trimmed).
    void loadScores() noexcept;

    // Atomically rewrites the file. Returns false (and logs) on failure.
    bool saveScores() const noexcept;

    // Empties the list and persists the empty list.
    bool clearScores();

    [[nodiscard]] const std::vector<HighScoreEntry>& scores() const noexcept { return m_scores; }
    [[nodiscard]] std::vector<HighScoreEntry> getScores() const { return m_scores; }

private:
    void sortAndTrim();

    std::filesystem::path       m_file;
    std::size_t                 m_maxScores = kDefaultMaxScores;
    std::vector<HighScoreEntry> m_scores;
};

} // namespace minefield::scores
