#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "custody/core/ScheduleSettings.hpp"
#include "custody/core/SlotClock.hpp"
#include "custody/data/FileScheduleRepository.hpp"
#include "custody/data/TimeBlockStore.hpp"
#include "custody/schedule/CareBalance.hpp"
#include "custody/schedule/ScheduleEngine.hpp"

using namespace custody;

namespace {

QDate parseDate(const QString &value, const QDate &fallback)
{
    if (value.isEmpty()) {
        return fallback;
    }
    return QDate::fromString(value, Qt::ISODate);
}

void printBlocks(QTextStream &out, const std::vector<data::TimeBlock> &blocks)
{
    QDate current;
    for (const auto &block : blocks) {
        if (block.date != current) {
            current = block.date;
            out << current.toString(QStringLiteral("dddd, MMM d yyyy")) << '\n';
        }
        out << "  " << core::SlotClock::formatSlotRange(block.startSlot, block.endSlot) << "  "
            << data::defaultDisplayName(block.provider);
        if (!block.note.isEmpty()) {
            out << "  (" << block.note << ')';
        }
        out << '\n';
    }
}

void printBalance(QTextStream &out, const schedule::CareBalance &balance, const core::CareWindow &window)
{
    out << '\n' << "Care time" << '\n';
    for (auto provider : data::AllCareProviders) {
        const double hours = balance.hours(provider);
        if (hours <= 0.0) {
            continue;
        }
        out << "  " << data::defaultDisplayName(provider) << ": " << QString::number(hours, 'f', 2) << " h";
        if (provider == data::CareProvider::ParentA || provider == data::CareProvider::ParentB) {
            out << " (" << QString::number(balance.fraction(provider) * 100.0, 'f', 0) << "%)";
        }
        out << '\n';
    }
    if (balance.isBalanced()) {
        out << "Balanced within " << QString::number(balance.thresholdHours(), 'f', 1) << " h" << '\n';
        return;
    }
    const auto days = balance.careDays(window.hours());
    out << data::defaultDisplayName(balance.ahead()) << " is ahead by " << days.format(balance.balanceDelta())
        << '\n';
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Custody"));
    QCoreApplication::setApplicationName(QStringLiteral("custody-report"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCustodyVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Prints the custody schedule and care balance for a date range."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Schedule file to read."));
    const QCommandLineOption fromOption(QStringList{ QStringLiteral("f"), QStringLiteral("from") },
                                        QStringLiteral("First day (YYYY-MM-DD), default today."),
                                        QStringLiteral("date"));
    const QCommandLineOption toOption(QStringList{ QStringLiteral("t"), QStringLiteral("to") },
                                      QStringLiteral("Last day (YYYY-MM-DD), default six days after the first."),
                                      QStringLiteral("date"));
    parser.addOption(fromOption);
    parser.addOption(toOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.size() != 1) {
        err << "Expected exactly one schedule file" << '\n';
        return 1;
    }

    const QDate from = parseDate(parser.value(fromOption), QDate::currentDate());
    const QDate to = parseDate(parser.value(toOption), from.addDays(6));
    if (!from.isValid() || !to.isValid() || to < from) {
        err << "Invalid date range" << '\n';
        return 1;
    }

    QSettings settingsStore;
    const core::ScheduleSettings settings = core::ScheduleSettings::load(settingsStore);

    data::FileScheduleRepository repository(arguments.front());
    schedule::ScheduleEngine engine(repository, settings);

    printBlocks(out, engine.store().blocksInRange(from, to));
    printBalance(out, engine.balance(from, to), settings.careWindow);
    return 0;
}
