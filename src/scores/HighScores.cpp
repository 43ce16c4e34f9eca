#include "minefield/scores/HighScores.hpp"

#include "io/AtomicFile.h"
#include "scores/HighScores_Format.h"
#include "util/TextEncoding.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace minefield::scores {

namespace {

using json = nlohmann::json;

[[nodiscard]] bool IsNumber(const json& v) noexcept
{
    return v.is_number_integer() || v.is_number_unsigned() || v.is_number_float();
}

// Records missing a name or carrying a non-finite / negative time are dropped.
[[nodiscard]] bool EntryFromJson(const json& j, HighScoreEntry& out)
{
    if (!j.is_object())
        return false;

    auto name = j.find("player_name");
    auto time = j.find("completion_time");
    if (name == j.end() || !name->is_string() || time == j.end() || !IsNumber(*time))
        return false;

    const double t = time->get<double>();
    if (!std::isfinite(t) || t < 0.0)
        return false;

    out.playerName = name->get<std::string>();
    out.completionTime = t;

    auto date = j.find("date_achieved");
    out.dateAchieved = (date != j.end() && date->is_string()) ? date->get<std::string>() : std::string{};
    return true;
}

[[nodiscard]] json EntryToJson(const HighScoreEntry& e)
{
    return json{
        {"player_name", e.playerName},
        {"completion_time", e.completionTime},
        {"date_achieved", e.dateAchieved},
    };
}

} // namespace

std::string CurrentIsoTimestamp()
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};

#if defined(_WIN32)
    if (localtime_s(&tm, &tt) != 0)
        return {};
#else
    if (!localtime_r(&tt, &tm))
        return {};
#endif

    char buf[32] = {};
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm) == 0)
        return {};
    return std::string(buf);
}

HighScoreEntry HighScoreEntry::Create(std::string playerName, double completionTime)
{
    HighScoreEntry e;
    e.playerName = std::move(playerName);
    e.completionTime = completionTime;
    e.dateAchieved = CurrentIsoTimestamp();
    return e;
}

HighScoreManager::HighScoreManager(std::filesystem::path file, std::size_t maxScores)
    : m_file(std::move(file))
    , m_maxScores(std::max<std::size_t>(1, maxScores))
{
    loadScores();
}

void HighScoreManager::sortAndTrim()
{
    std::stable_sort(m_scores.begin(), m_scores.end(),
                     [](const HighScoreEntry& a, const HighScoreEntry& b) {
                         return a.completionTime < b.completionTime;
                     });
    if (m_scores.size() > m_maxScores)
        m_scores.resize(m_maxScores);
}

void HighScoreManager::loadScores() noexcept
{
    m_scores.clear();

    try
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_file, ec))
            return; // first run

        std::string text;
        std::string err;
        if (!io::read_all(m_file, text, &err, savefmt::kMaxScoresFileBytes))
        {
            spdlog::warn("High scores: cannot read {} ({}); starting empty", m_file.string(), err);
            return;
        }

        if (!util::NormalizeTextToUtf8(text))
        {
            spdlog::warn("High scores: {} is not UTF-8; starting empty", m_file.string());
            return;
        }

        const json doc = json::parse(text, nullptr, false);
        if (doc.is_discarded())
        {
            spdlog::warn("High scores: {} is not valid JSON; starting empty", m_file.string());
            return;
        }

        const json* records = nullptr;
        if (doc.is_array())
        {
            records = &doc; // legacy bare list
        }
        else if (doc.is_object())
        {
            const std::string format = doc.value("format", std::string{});
            if (format != savefmt::kScoresFormat)
            {
                spdlog::warn("High scores: {} has unsupported format '{}'; starting empty", m_file.string(), format);
                return;
            }
            auto it = doc.find("scores");
            if (it != doc.end() && it->is_array())
                records = &*it;
        }

        if (!records)
        {
            spdlog::warn("High scores: {} has no score list; starting empty", m_file.string());
            return;
        }

        std::size_t dropped = 0;
        for (const json& r : *records)
        {
            HighScoreEntry e;
            if (EntryFromJson(r, e))
                m_scores.push_back(std::move(e));
            else
                ++dropped;
        }
        if (dropped > 0)
            spdlog::warn("High scores: skipped {} malformed record(s) in {}", dropped, m_file.string());

        sortAndTrim();
    }
    catch (const std::exception& e)
    {
        m_scores.clear();
        spdlog::error("High scores: failed to load {}: {}", m_file.string(), e.what());
    }
}

bool HighScoreManager::saveScores() const noexcept
{
    try
    {
        json list = json::array();
        for (const HighScoreEntry& e : m_scores)
            list.push_back(EntryToJson(e));

        json doc;
        doc["format"] = savefmt::kScoresFormat;
        doc["version"] = savefmt::kScoresVersion;
        doc["scores"] = std::move(list);

        std::string err;
        if (!io::write_atomic(m_file, doc.dump(2), &err))
        {
            spdlog::error("High scores: save to {} skipped: {}", m_file.string(), err);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        spdlog::error("High scores: save to {} failed: {}", m_file.string(), e.what());
        return false;
    }
}

bool HighScoreManager::qualifiesForHighScore(double completionTime)
{
    loadScores();

    if (m_scores.size() < m_maxScores)
        return true;
    return completionTime < m_scores.back().completionTime;
}

bool HighScoreManager::addScore(const std::string& playerName, double completionTime)
{
    if (!qualifiesForHighScore(completionTime))
        return false;

    if (m_scores.size() >= m_maxScores)
        m_scores.pop_back(); // drop the current worst

    m_scores.push_back(HighScoreEntry::Create(playerName, completionTime));
    sortAndTrim();

    if (!saveScores())
        spdlog::warn("High scores: '{}' ({}s) kept in memory only", playerName, completionTime);
    else
        spdlog::info("High scores: recorded '{}' ({}s)", playerName, completionTime);
    return true;
}

bool HighScoreManager::clearScores()
{
    m_scores.clear();
    return saveScores();
}

} // namespace minefield::scores
