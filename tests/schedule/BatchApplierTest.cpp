#include <QtTest/QtTest>

#include <QtConcurrent/QtConcurrent>

#include "custody/data/StoreTransaction.hpp"
#include "custody/data/TimeBlockStore.hpp"
#include "custody/schedule/BatchApplier.hpp"

using namespace custody;
using custody::core::CareWindowPolicy;
using custody::core::ErrorCode;
using custody::core::OverlapPolicy;
using custody::schedule::ApplyPolicy;
using custody::schedule::BatchApplier;
using custody::schedule::ChangeBatch;
using custody::schedule::ChangeProposal;

namespace {

data::TimeBlock makeBlock(const QDate &date, int start, int end, data::CareProvider provider)
{
    data::TimeBlock block;
    block.date = date;
    block.startSlot = start;
    block.endSlot = end;
    block.provider = provider;
    return block;
}

BatchApplier applier(CareWindowPolicy window = CareWindowPolicy::Reject, OverlapPolicy overlap = OverlapPolicy::Reject)
{
    return BatchApplier(core::CareWindow{}, ApplyPolicy{ window, overlap });
}

const QDate kMonday(2024, 3, 4);

} // namespace

class BatchApplierTest : public QObject
{
    Q_OBJECT

private slots:
    void swapPreservesTotals();
    void failingProposalLeavesStoreUntouched();
    void invalidProposalIsReportedBeforeApplying();
    void staleReferenceIsRejected();
    void laterProposalSeesEarlierOne();
    void rejectsOutsideCareWindow();
    void clampsToCareWindow();
    void clampWithoutOverlapFails();
    void rejectsOverlaps();
    void displacesOverlappedBlocks();
    void allowsOverlapsWhenConfigured();
    void emptyBatchSucceeds();
    void busyStoreIsReported();
    void reportsHoursDelta();
    void policyFollowsBatchSource();
};

void BatchApplierTest::swapPreservesTotals()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    const auto b = makeBlock(kMonday, 48, 64, data::CareProvider::ParentB);
    data::TimeBlockStore store({ a, b });

    ChangeBatch batch;
    batch.changes = { ChangeProposal::swapProviders(a, b) };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.appliedCount, 1);

    const auto day = store.blocksForDate(kMonday);
    QCOMPARE(day.size(), static_cast<std::size_t>(2));
    QVERIFY(day.at(0).provider == data::CareProvider::ParentB);
    QCOMPARE(day.at(0).startSlot, 32);
    QCOMPARE(day.at(0).endSlot, 48);
    QVERIFY(day.at(1).provider == data::CareProvider::ParentA);
    QCOMPARE(day.at(1).startSlot, 48);
    QCOMPARE(day.at(1).endSlot, 64);

    QCOMPARE(data::TimeBlockStore::totalHours(store.blocks()), 8.0);
    QCOMPARE(data::TimeBlockStore::totalHours(store.blocksForProvider(data::CareProvider::ParentA)), 4.0);
    QCOMPARE(data::TimeBlockStore::totalHours(store.blocksForProvider(data::CareProvider::ParentB)), 4.0);
    QVERIFY(outcome.hoursDelta.empty());
    QCOMPARE(store.revision(), quint64(1));
}

void BatchApplierTest::failingProposalLeavesStoreUntouched()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    const auto b = makeBlock(kMonday.addDays(1), 32, 48, data::CareProvider::ParentB);
    data::TimeBlockStore store({ a, b });
    const auto before = store.blocks();

    ChangeBatch batch;
    batch.changes = {
        ChangeProposal::reassign(a, data::CareProvider::Nanny),
        // Ends after the care window closes.
        ChangeProposal::retime(b, kMonday.addDays(1), 60, 90),
    };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::OutOfCareWindow);
    QCOMPARE(outcome.error->proposalIndex, 1);
    QCOMPARE(outcome.error->proposalId, batch.changes.at(1).id());
    QCOMPARE(outcome.appliedCount, 0);

    QVERIFY(store.blocks() == before);
    QCOMPARE(store.revision(), quint64(0));
}

void BatchApplierTest::invalidProposalIsReportedBeforeApplying()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });

    ChangeBatch batch;
    batch.changes = { ChangeProposal::remove(a), ChangeProposal::retime(a, kMonday, 48, 40) };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::InvalidProposal);
    QCOMPARE(outcome.error->proposalIndex, 1);
    QCOMPARE(store.size(), static_cast<std::size_t>(1));
}

void BatchApplierTest::staleReferenceIsRejected()
{
    auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });

    auto outdated = a;
    outdated.startSlot = 30;
    ChangeBatch stale;
    stale.changes = { ChangeProposal::reassign(outdated, data::CareProvider::Nanny) };
    auto outcome = applier().apply(stale, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::StaleReference);

    ChangeBatch missing;
    missing.changes = { ChangeProposal::remove(makeBlock(kMonday, 50, 60, data::CareProvider::ParentB)) };
    outcome = applier().apply(missing, store);
    QVERIFY(outcome.error->code == ErrorCode::StaleReference);

    ChangeBatch duplicate;
    duplicate.changes = { ChangeProposal::add(a) };
    outcome = applier().apply(duplicate, store);
    QVERIFY(outcome.error->code == ErrorCode::StaleReference);
}

void BatchApplierTest::laterProposalSeesEarlierOne()
{
    data::TimeBlockStore store;
    const auto added = makeBlock(kMonday, 32, 40, data::CareProvider::Nanny);

    auto retimed = added;
    retimed.startSlot = 36;
    retimed.endSlot = 44;

    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(added), ChangeProposal::retime(added, kMonday, 36, 44) };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.appliedCount, 2);
    QCOMPARE(store.size(), static_cast<std::size_t>(1));
    QVERIFY(*store.findById(added.id) == retimed);
}

void BatchApplierTest::rejectsOutsideCareWindow()
{
    data::TimeBlockStore store;
    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(makeBlock(kMonday, 24, 40, data::CareProvider::ParentA)) };
    const auto outcome = applier(CareWindowPolicy::Reject).apply(batch, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::OutOfCareWindow);
    QCOMPARE(store.size(), static_cast<std::size_t>(0));
}

void BatchApplierTest::clampsToCareWindow()
{
    data::TimeBlockStore store;
    const auto early = makeBlock(kMonday, 24, 88, data::CareProvider::ParentA);
    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(early) };
    const auto outcome = applier(CareWindowPolicy::Clamp).apply(batch, store);
    QVERIFY(outcome.ok());

    const auto stored = store.findById(early.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->startSlot, 28);
    QCOMPARE(stored->endSlot, 78);
    QCOMPARE(outcome.hoursDelta.at(data::CareProvider::ParentA), 12.5);
}

void BatchApplierTest::clampWithoutOverlapFails()
{
    data::TimeBlockStore store;
    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(makeBlock(kMonday, 0, 20, data::CareProvider::ParentA)) };
    const auto outcome = applier(CareWindowPolicy::Clamp).apply(batch, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::OutOfCareWindow);
    QCOMPARE(store.size(), static_cast<std::size_t>(0));
}

void BatchApplierTest::rejectsOverlaps()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });

    ChangeBatch batch;
    batch.changes = {
        ChangeProposal::add(makeBlock(kMonday.addDays(1), 32, 48, data::CareProvider::ParentB)),
        ChangeProposal::add(makeBlock(kMonday, 40, 56, data::CareProvider::ParentB)),
    };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::OverlappingBlocks);
    QCOMPARE(outcome.error->proposalIndex, 1);
    QCOMPARE(store.size(), static_cast<std::size_t>(1));
}

void BatchApplierTest::displacesOverlappedBlocks()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    const auto untouched = makeBlock(kMonday, 60, 64, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a, untouched });

    const auto incoming = makeBlock(kMonday, 40, 56, data::CareProvider::ParentB);
    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(incoming) };
    const auto outcome = applier(CareWindowPolicy::Reject, OverlapPolicy::Displace).apply(batch, store);
    QVERIFY(outcome.ok());
    QVERIFY(!store.findById(a.id).has_value());
    QVERIFY(store.findById(incoming.id).has_value());
    QVERIFY(store.findById(untouched.id).has_value());
    QCOMPARE(outcome.hoursDelta.at(data::CareProvider::ParentA), -4.0);
    QCOMPARE(outcome.hoursDelta.at(data::CareProvider::ParentB), 4.0);
    QCOMPARE(outcome.displaced.size(), static_cast<std::size_t>(1));
    QVERIFY(outcome.displaced.front() == a);

    // The compensating batch brings the displaced block back.
    const auto undo = batch.compensating(outcome.displaced);
    QCOMPARE(undo.changeCount(), static_cast<std::size_t>(2));
    const auto undone = applier(CareWindowPolicy::Reject, OverlapPolicy::Displace).apply(undo, store);
    QVERIFY(undone.ok());
    QVERIFY(undone.displaced.empty());
    QVERIFY(store.findById(a.id) == a);
    QVERIFY(!store.findById(incoming.id).has_value());

    // Two blocks of the same batch cannot displace each other.
    ChangeBatch clash;
    clash.changes = {
        ChangeProposal::add(makeBlock(kMonday.addDays(2), 32, 48, data::CareProvider::ParentA)),
        ChangeProposal::add(makeBlock(kMonday.addDays(2), 40, 56, data::CareProvider::ParentB)),
    };
    const auto clashOutcome = applier(CareWindowPolicy::Reject, OverlapPolicy::Displace).apply(clash, store);
    QVERIFY(!clashOutcome.ok());
    QVERIFY(clashOutcome.error->code == ErrorCode::OverlappingBlocks);
}

void BatchApplierTest::allowsOverlapsWhenConfigured()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });

    ChangeBatch batch;
    batch.changes = { ChangeProposal::add(makeBlock(kMonday, 40, 56, data::CareProvider::Nanny)) };
    const auto outcome = applier(CareWindowPolicy::Reject, OverlapPolicy::Allow).apply(batch, store);
    QVERIFY(outcome.ok());
    QCOMPARE(store.findOverlaps(kMonday).size(), static_cast<std::size_t>(1));
}

void BatchApplierTest::emptyBatchSucceeds()
{
    data::TimeBlockStore store;
    const auto outcome = applier().apply(ChangeBatch(), store);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.appliedCount, 0);
    QVERIFY(!outcome.error.has_value());
    QCOMPARE(store.revision(), quint64(0));
}

void BatchApplierTest::busyStoreIsReported()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });
    auto holder = store.beginTransaction();
    QVERIFY(holder);

    ChangeBatch batch;
    batch.changes = { ChangeProposal::reassign(a, data::CareProvider::Nanny) };
    auto future = QtConcurrent::run([&store, &batch]() {
        return applier().apply(batch, store);
    });
    const auto outcome = future.result();
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->code == ErrorCode::StoreBusy);

    holder->rollback();
    QVERIFY(store.findById(a.id)->provider == data::CareProvider::ParentA);
}

void BatchApplierTest::reportsHoursDelta()
{
    const auto a = makeBlock(kMonday, 32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ a });

    ChangeBatch batch;
    batch.changes = { ChangeProposal::reassign(a, data::CareProvider::ParentB) };
    const auto outcome = applier().apply(batch, store);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.hoursDelta.size(), static_cast<std::size_t>(2));
    QCOMPARE(outcome.hoursDelta.at(data::CareProvider::ParentA), -4.0);
    QCOMPARE(outcome.hoursDelta.at(data::CareProvider::ParentB), 4.0);
    QCOMPARE(outcome.affectedDates.size(), static_cast<std::size_t>(1));
    QCOMPARE(outcome.affectedDates.front(), kMonday);
}

void BatchApplierTest::policyFollowsBatchSource()
{
    const core::ScheduleSettings settings;
    const auto block = makeBlock(kMonday, 24, 40, data::CareProvider::ParentA);

    ChangeBatch manual;
    manual.changes = { ChangeProposal::add(block) };
    QVERIFY(BatchApplier::policyFor(manual, settings).careWindow == CareWindowPolicy::Clamp);

    ChangeBatch suggested;
    suggested.changes = { ChangeProposal::add(block).suggestedBy(QStringLiteral("Early start")) };
    QVERIFY(BatchApplier::policyFor(suggested, settings).careWindow == CareWindowPolicy::Reject);
    QVERIFY(BatchApplier::policyFor(suggested, settings).overlap == OverlapPolicy::Reject);
}

QTEST_GUILESS_MAIN(BatchApplierTest)
#include "BatchApplierTest.moc"
