#include "custody/data/FileScheduleRepository.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStringList>
#include <QTextStream>

#include "custody/core/Logging.hpp"

namespace custody {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    return QUuid(QStringLiteral("{%1}").arg(value.trimmed()));
}

constexpr int MAX_LINE_OCTETS = 75;

// Splits a content line into 75-octet pieces (UTF-8), continuation lines start
// with a single space. Multi-byte characters are never split.
QString foldLine(const QString &line)
{
    QString folded;
    int octets = 0;
    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line.at(i);
        int units = 1;
        int width = 1;
        if (ch.isHighSurrogate() && i + 1 < line.size() && line.at(i + 1).isLowSurrogate()) {
            units = 2;
            width = 4;
        } else if (ch.unicode() >= 0x800) {
            width = 3;
        } else if (ch.unicode() >= 0x80) {
            width = 2;
        }
        if (octets + width > MAX_LINE_OCTETS) {
            folded += QLatin1String("\n ");
            octets = 1;
        }
        folded += line.mid(i, units);
        octets += width;
        i += units - 1;
    }
    return folded;
}
} // namespace

FileScheduleRepository::FileScheduleRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

std::vector<TimeBlock> FileScheduleRepository::loadBlocks() const
{
    return m_blocks;
}

bool FileScheduleRepository::saveBlocks(const std::vector<TimeBlock> &blocks)
{
    const auto previous = m_blocks;
    m_blocks = blocks;
    if (!save()) {
        m_blocks = previous;
        return false;
    }
    return true;
}

std::vector<ScheduleChangeEntry> FileScheduleRepository::loadJournal() const
{
    return m_journal;
}

bool FileScheduleRepository::appendJournalEntry(const ScheduleChangeEntry &entry)
{
    m_journal.push_back(entry);
    if (!save()) {
        m_journal.pop_back();
        return false;
    }
    return true;
}

const QString &FileScheduleRepository::filePath() const
{
    return m_filePath;
}

void FileScheduleRepository::load()
{
    m_blocks.clear();
    m_journal.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcPersistence) << "Cannot open schedule file" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Block,
        Journal
    };

    Section currentSection = Section::None;
    TimeBlock currentBlock;
    bool blockHasProvider = false;
    ScheduleChangeEntry currentEntry;

    auto finalizeBlock = [&]() {
        if (currentBlock.id.isNull() || !blockHasProvider || !currentBlock.isValid()) {
            qCWarning(lcPersistence) << "Skipping malformed block" << currentBlock.id
                                     << currentBlock.startSlot << currentBlock.endSlot;
            return;
        }
        m_blocks.push_back(currentBlock);
    };

    auto finalizeEntry = [&]() {
        if (currentEntry.id.isNull()) {
            qCWarning(lcPersistence) << "Skipping journal entry without UID";
            return;
        }
        m_journal.push_back(currentEntry);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Block;
            currentBlock = TimeBlock{};
            currentBlock.id = QUuid();
            blockHasProvider = false;
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeBlock();
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:VJOURNAL")) {
            currentSection = Section::Journal;
            currentEntry = ScheduleChangeEntry{};
            currentEntry.id = QUuid();
            return;
        }
        if (line == QLatin1String("END:VJOURNAL")) {
            finalizeEntry();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Block) {
            if (name == QLatin1String("UID")) {
                currentBlock.id = parseUid(rawValue);
            } else if (name == QLatin1String("DTSTART")) {
                currentBlock.date = QDate::fromString(rawValue.left(8), QLatin1String(DATE_FORMAT));
            } else if (name == QLatin1String("X-CUSTODY-START-SLOT")) {
                currentBlock.startSlot = rawValue.toInt();
            } else if (name == QLatin1String("X-CUSTODY-END-SLOT")) {
                currentBlock.endSlot = rawValue.toInt();
            } else if (name == QLatin1String("X-CUSTODY-PROVIDER")) {
                if (const auto provider = providerFromKey(rawValue)) {
                    currentBlock.provider = *provider;
                    blockHasProvider = true;
                }
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentBlock.note = value;
            } else if (name == QLatin1String("X-CUSTODY-SERIES")) {
                currentBlock.seriesId = parseUid(rawValue);
            }
            return;
        }

        if (currentSection == Section::Journal) {
            if (name == QLatin1String("UID")) {
                currentEntry.id = parseUid(rawValue);
            } else if (name == QLatin1String("DTSTAMP")) {
                currentEntry.timestamp = parseDateTime(rawValue);
            } else if (name == QLatin1String("SUMMARY")) {
                currentEntry.title = value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentEntry.narration = value;
            } else if (name == QLatin1String("X-CUSTODY-ACTOR")) {
                currentEntry.actorName = value;
            } else if (name == QLatin1String("X-CUSTODY-ROLE")) {
                currentEntry.actorRole = providerFromKey(rawValue).value_or(CareProvider::Unassigned);
            } else if (name == QLatin1String("X-CUSTODY-BATCH")) {
                currentEntry.batchId = parseUid(rawValue);
            } else if (name == QLatin1String("X-CUSTODY-AI-SUMMARY")) {
                currentEntry.aiSummary = value;
            } else if (name == QLatin1String("X-CUSTODY-CHANGES")) {
                currentEntry.changesApplied = rawValue.toInt();
            } else if (name == QLatin1String("X-CUSTODY-DATES")) {
                currentEntry.datesImpacted = parseDates(rawValue);
            } else if (name == QLatin1String("X-CUSTODY-DELTA")) {
                currentEntry.careTimeDelta = parseDelta(rawValue);
            } else if (name == QLatin1String("X-CUSTODY-BREAKDOWN")) {
                currentEntry.breakdown = value;
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcPersistence) << "Loaded" << m_blocks.size() << "blocks and" << m_journal.size()
                           << "journal entries from" << m_filePath;
}

bool FileScheduleRepository::save() const
{
    if (m_filePath.isEmpty()) {
        qCWarning(lcPersistence) << "No schedule file configured";
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPersistence) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcPersistence) << "Cannot write schedule file" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    const auto writeLine = [&stream](const QString &line) { stream << foldLine(line) << '\n'; };

    writeLine(QStringLiteral("BEGIN:VCALENDAR"));
    writeLine(QStringLiteral("VERSION:2.0"));
    writeLine(QStringLiteral("PRODID:-//Custody Scheduler//EN"));

    for (const TimeBlock &block : m_blocks) {
        writeLine(QStringLiteral("BEGIN:VEVENT"));
        writeLine(QStringLiteral("UID:") + prepareUid(block.id));
        writeLine(QStringLiteral("SUMMARY:") + encodeText(defaultDisplayName(block.provider)));
        writeLine(QStringLiteral("DTSTART;VALUE=DATE:") + block.date.toString(QLatin1String(DATE_FORMAT)));
        writeLine(QStringLiteral("X-CUSTODY-START-SLOT:") + QString::number(block.startSlot));
        writeLine(QStringLiteral("X-CUSTODY-END-SLOT:") + QString::number(block.endSlot));
        writeLine(QStringLiteral("X-CUSTODY-PROVIDER:") + providerKey(block.provider));
        if (!block.note.isEmpty()) {
            writeLine(QStringLiteral("DESCRIPTION:") + encodeText(block.note));
        }
        if (!block.seriesId.isNull()) {
            writeLine(QStringLiteral("X-CUSTODY-SERIES:") + prepareUid(block.seriesId));
        }
        writeLine(QStringLiteral("END:VEVENT"));
    }

    for (const ScheduleChangeEntry &entry : m_journal) {
        writeLine(QStringLiteral("BEGIN:VJOURNAL"));
        writeLine(QStringLiteral("UID:") + prepareUid(entry.id));
        if (entry.timestamp.isValid()) {
            writeLine(QStringLiteral("DTSTAMP:") + formatDateTime(entry.timestamp));
        }
        writeLine(QStringLiteral("SUMMARY:") + encodeText(entry.title));
        if (!entry.narration.isEmpty()) {
            writeLine(QStringLiteral("DESCRIPTION:") + encodeText(entry.narration));
        }
        writeLine(QStringLiteral("X-CUSTODY-ACTOR:") + encodeText(entry.actorName));
        writeLine(QStringLiteral("X-CUSTODY-ROLE:") + providerKey(entry.actorRole));
        if (!entry.batchId.isNull()) {
            writeLine(QStringLiteral("X-CUSTODY-BATCH:") + prepareUid(entry.batchId));
        }
        if (!entry.aiSummary.isEmpty()) {
            writeLine(QStringLiteral("X-CUSTODY-AI-SUMMARY:") + encodeText(entry.aiSummary));
        }
        writeLine(QStringLiteral("X-CUSTODY-CHANGES:") + QString::number(entry.changesApplied));
        if (!entry.datesImpacted.empty()) {
            writeLine(QStringLiteral("X-CUSTODY-DATES:") + formatDates(entry.datesImpacted));
        }
        if (!entry.careTimeDelta.empty()) {
            writeLine(QStringLiteral("X-CUSTODY-DELTA:") + formatDelta(entry.careTimeDelta));
        }
        if (!entry.breakdown.isEmpty()) {
            writeLine(QStringLiteral("X-CUSTODY-BREAKDOWN:") + encodeText(entry.breakdown));
        }
        writeLine(QStringLiteral("END:VJOURNAL"));
    }

    writeLine(QStringLiteral("END:VCALENDAR"));

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcPersistence) << "Committing schedule file failed" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QString FileScheduleRepository::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileScheduleRepository::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == '\\' && i + 1 < text.size()) {
            const QChar next = text.at(++i);
            if (next == 'n' || next == 'N') {
                decoded += '\n';
            } else {
                decoded += next;
            }
            continue;
        }
        decoded += c;
    }
    return decoded;
}

QString FileScheduleRepository::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileScheduleRepository::parseDateTime(const QString &value)
{
    QDateTime dt = QDateTime::fromString(value, QLatin1String(DATE_TIME_FORMAT));
    dt.setTimeSpec(Qt::UTC);
    return dt;
}

QString FileScheduleRepository::formatDates(const std::vector<QDate> &dates)
{
    QStringList parts;
    for (const QDate &date : dates) {
        parts << date.toString(QLatin1String(DATE_FORMAT));
    }
    return parts.join(',');
}

std::vector<QDate> FileScheduleRepository::parseDates(const QString &value)
{
    std::vector<QDate> dates;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QDate date = QDate::fromString(part.trimmed(), QLatin1String(DATE_FORMAT));
        if (date.isValid()) {
            dates.push_back(date);
        }
    }
    return dates;
}

QString FileScheduleRepository::formatDelta(const std::map<CareProvider, double> &delta)
{
    QStringList parts;
    for (const auto &item : delta) {
        parts << QStringLiteral("%1=%2").arg(providerKey(item.first), QString::number(item.second, 'f', 2));
    }
    return parts.join(',');
}

std::map<CareProvider, double> FileScheduleRepository::parseDelta(const QString &value)
{
    std::map<CareProvider, double> delta;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString key = part.section('=', 0, 0);
        const auto provider = providerFromKey(key);
        bool ok = false;
        const double hours = part.section('=', 1).toDouble(&ok);
        if (provider && ok) {
            delta[*provider] = hours;
        }
    }
    return delta;
}

} // namespace data
} // namespace custody
