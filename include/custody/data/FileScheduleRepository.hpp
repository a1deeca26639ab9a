#pragma once

#include <QDateTime>
#include <QString>

#include "custody/data/ScheduleRepository.hpp"

namespace custody {
namespace data {

// Stores the schedule as an iCalendar-style text file: one VEVENT per block and
// one VJOURNAL per activity entry. Writes go through QSaveFile so a failed save
// never leaves a truncated file behind.
class FileScheduleRepository : public ScheduleRepository
{
public:
    explicit FileScheduleRepository(QString filePath);
    ~FileScheduleRepository() override = default;

    std::vector<TimeBlock> loadBlocks() const override;
    bool saveBlocks(const std::vector<TimeBlock> &blocks) override;
    std::vector<ScheduleChangeEntry> loadJournal() const override;
    bool appendJournalEntry(const ScheduleChangeEntry &entry) override;

    const QString &filePath() const;

private:
    void load();
    bool save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);
    static QString formatDates(const std::vector<QDate> &dates);
    static std::vector<QDate> parseDates(const QString &value);
    static QString formatDelta(const std::map<CareProvider, double> &delta);
    static std::map<CareProvider, double> parseDelta(const QString &value);

    QString m_filePath;
    std::vector<TimeBlock> m_blocks;
    std::vector<ScheduleChangeEntry> m_journal;
};

} // namespace data
} // namespace custody
