#include <QtConcurrent/QtConcurrent>
#include <QtTest/QtTest>

#include "custody/data/StoreTransaction.hpp"
#include "custody/data/TimeBlockStore.hpp"
#include "custody/schedule/BatchReview.hpp"
#include "custody/schedule/ReviewQueue.hpp"

using namespace custody;
using custody::core::ErrorCode;
using custody::schedule::BatchApplier;
using custody::schedule::BatchReview;
using custody::schedule::ChangeBatch;
using custody::schedule::ChangeProposal;
using custody::schedule::ReviewQueue;
using custody::schedule::ReviewState;

namespace {

const QDate kMonday(2024, 3, 4);

data::TimeBlock makeBlock(int start, int end, data::CareProvider provider)
{
    data::TimeBlock block;
    block.date = kMonday;
    block.startSlot = start;
    block.endSlot = end;
    block.provider = provider;
    return block;
}

ChangeBatch reassignBatch(const data::TimeBlock &block)
{
    ChangeBatch batch;
    batch.changes = { ChangeProposal::reassign(block, data::CareProvider::Nanny) };
    return batch;
}

BatchApplier defaultApplier()
{
    return BatchApplier(core::CareWindow{}, schedule::ApplyPolicy{});
}

} // namespace

class ApprovalWorkflowTest : public QObject
{
    Q_OBJECT

private slots:
    void happyPath();
    void rejectIsTerminal();
    void applyRequiresApproval();
    void failedApplyCanBeReapproved();
    void busyStoreKeepsApproval();
    void discardFromProposedOrFailed();
    void appliedIsTerminal();
    void queueBulkOperations();
    void queueUnknownBatch();
    void queuePrunesSettledReviews();
};

void ApprovalWorkflowTest::happyPath()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ block });
    BatchReview review(reassignBatch(block));
    QVERIFY(review.state() == ReviewState::Proposed);

    const auto approved = review.approve();
    QVERIFY(approved.ok);
    QVERIFY(approved.state == ReviewState::Approved);

    const auto applied = review.apply(store, defaultApplier());
    QVERIFY(applied.ok);
    QVERIFY(review.state() == ReviewState::Applied);
    QVERIFY(review.lastOutcome().has_value());
    QCOMPARE(review.lastOutcome()->appliedCount, 1);
    QVERIFY(store.findById(block.id)->provider == data::CareProvider::Nanny);
}

void ApprovalWorkflowTest::rejectIsTerminal()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ block });
    BatchReview review(reassignBatch(block));

    QVERIFY(review.reject().ok);
    QVERIFY(schedule::isTerminal(review.state()));

    const auto approve = review.approve();
    QVERIFY(!approve.ok);
    QVERIFY(approve.error->code == ErrorCode::InvalidTransition);
    QVERIFY(!review.reject().ok);
    QVERIFY(!review.discard().ok);
    QVERIFY(!review.apply(store, defaultApplier()).ok);
    QVERIFY(review.state() == ReviewState::Rejected);
    QVERIFY(store.findById(block.id)->provider == data::CareProvider::ParentA);
}

void ApprovalWorkflowTest::applyRequiresApproval()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ block });
    BatchReview review(reassignBatch(block));

    const auto result = review.apply(store, defaultApplier());
    QVERIFY(!result.ok);
    QVERIFY(result.error->code == ErrorCode::InvalidTransition);
    QVERIFY(review.state() == ReviewState::Proposed);
    QVERIFY(!review.lastOutcome().has_value());
    QCOMPARE(store.revision(), quint64(0));
}

void ApprovalWorkflowTest::failedApplyCanBeReapproved()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store;
    BatchReview review(reassignBatch(block));
    QVERIFY(review.approve().ok);

    const auto failed = review.apply(store, defaultApplier());
    QVERIFY(!failed.ok);
    QVERIFY(failed.state == ReviewState::ApplyFailed);
    QVERIFY(failed.error->code == ErrorCode::ApplyFailed);
    QCOMPARE(failed.error->proposalIndex, 0);
    QVERIFY(review.lastOutcome()->error->code == ErrorCode::StaleReference);

    QVERIFY(!review.reject().ok);
    QVERIFY(review.approve().ok);

    // The referenced block exists now.
    {
        auto transaction = store.beginTransaction();
        QVERIFY(transaction->insert(block));
        transaction->commit();
    }
    QVERIFY(review.apply(store, defaultApplier()).ok);
    QVERIFY(review.state() == ReviewState::Applied);
}

void ApprovalWorkflowTest::busyStoreKeepsApproval()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ block });
    BatchReview review(reassignBatch(block));
    QVERIFY(review.approve().ok);

    auto holder = store.beginTransaction();
    QVERIFY(holder);

    auto future = QtConcurrent::run([&review, &store]() { return review.apply(store, defaultApplier()); });
    const auto busy = future.result();
    QVERIFY(!busy.ok);
    QVERIFY(busy.error->code == ErrorCode::StoreBusy);
    QVERIFY(review.state() == ReviewState::Approved);

    holder->rollback();
    QVERIFY(review.apply(store, defaultApplier()).ok);
}

void ApprovalWorkflowTest::discardFromProposedOrFailed()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store;

    BatchReview proposed(reassignBatch(block));
    QVERIFY(proposed.discard().ok);
    QVERIFY(proposed.state() == ReviewState::Discarded);
    QVERIFY(!proposed.approve().ok);

    BatchReview approved(reassignBatch(block));
    QVERIFY(approved.approve().ok);
    QVERIFY(!approved.discard().ok);
    QVERIFY(approved.state() == ReviewState::Approved);

    QVERIFY(!approved.apply(store, defaultApplier()).ok);
    QVERIFY(approved.state() == ReviewState::ApplyFailed);
    QVERIFY(approved.discard().ok);
    QVERIFY(schedule::isTerminal(approved.state()));
}

void ApprovalWorkflowTest::appliedIsTerminal()
{
    const auto block = makeBlock(32, 48, data::CareProvider::ParentA);
    data::TimeBlockStore store({ block });
    BatchReview review(reassignBatch(block));
    QVERIFY(review.approve().ok);
    QVERIFY(review.apply(store, defaultApplier()).ok);

    QVERIFY(!review.approve().ok);
    QVERIFY(!review.reject().ok);
    QVERIFY(!review.discard().ok);
    const auto again = review.apply(store, defaultApplier());
    QVERIFY(!again.ok);
    QVERIFY(again.error->code == ErrorCode::InvalidTransition);
    QCOMPARE(store.revision(), quint64(1));
}

void ApprovalWorkflowTest::queueBulkOperations()
{
    const auto first = makeBlock(32, 40, data::CareProvider::ParentA);
    const auto second = makeBlock(40, 48, data::CareProvider::ParentB);
    const auto third = makeBlock(48, 56, data::CareProvider::ParentA);
    data::TimeBlockStore store({ first, second, third });

    ReviewQueue queue;
    const auto batchA = reassignBatch(first);
    const auto batchB = reassignBatch(second);
    const auto batchC = reassignBatch(third);
    queue.add(batchA);
    queue.add(batchB);
    queue.add(batchC);
    QCOMPARE(queue.size(), static_cast<std::size_t>(3));

    QVERIFY(queue.reject(batchC.id).ok);

    const auto approvals = queue.approveAll();
    QCOMPARE(approvals.size(), static_cast<std::size_t>(2));
    QCOMPARE(approvals.at(0).batchId, batchA.id);
    QVERIFY(approvals.at(1).result.ok);

    const auto applied = queue.applyAllApproved(store, core::ScheduleSettings());
    QCOMPARE(applied.size(), static_cast<std::size_t>(2));
    QVERIFY(applied.at(0).result.ok);
    QVERIFY(applied.at(1).result.ok);
    QVERIFY(queue.find(batchA.id)->state() == ReviewState::Applied);
    QVERIFY(queue.find(batchC.id)->state() == ReviewState::Rejected);
    QVERIFY(queue.pending().empty());
    QVERIFY(queue.rejectAll().empty());
    QVERIFY(store.findById(third.id)->provider == data::CareProvider::ParentA);
}

void ApprovalWorkflowTest::queueUnknownBatch()
{
    ReviewQueue queue;
    const auto result = queue.approve(QUuid::createUuid());
    QVERIFY(!result.ok);
    QVERIFY(result.error->code == ErrorCode::InvalidTransition);
    QVERIFY(!queue.find(QUuid::createUuid()).has_value());
}

void ApprovalWorkflowTest::queuePrunesSettledReviews()
{
    const auto first = makeBlock(32, 40, data::CareProvider::ParentA);
    const auto second = makeBlock(40, 48, data::CareProvider::ParentB);
    const auto third = makeBlock(48, 56, data::CareProvider::ParentA);
    data::TimeBlockStore store({ first, second, third });

    ReviewQueue queue;
    const auto applied = reassignBatch(first);
    const auto rejected = reassignBatch(second);
    const auto failed = reassignBatch(makeBlock(60, 64, data::CareProvider::ParentB));
    const auto waiting = reassignBatch(third);
    queue.add(applied);
    queue.add(rejected);
    queue.add(failed);
    queue.add(waiting);

    QVERIFY(queue.approve(applied.id).ok);
    QVERIFY(queue.apply(applied.id, store, core::ScheduleSettings()).ok);
    QVERIFY(queue.reject(rejected.id).ok);
    QVERIFY(queue.approve(failed.id).ok);
    QVERIFY(!queue.apply(failed.id, store, core::ScheduleSettings()).ok);

    QVERIFY(queue.find(applied.id)->settledAt().isValid());
    QVERIFY(!queue.find(failed.id)->settledAt().isValid());
    QVERIFY(!queue.find(waiting.id)->settledAt().isValid());

    QVERIFY(queue.pruneSettled(QDateTime::currentDateTimeUtc().addSecs(-3600)).empty());

    const auto pruned = queue.pruneSettled(QDateTime::currentDateTimeUtc().addSecs(60));
    QCOMPARE(pruned.size(), static_cast<std::size_t>(2));
    QCOMPARE(pruned.at(0), applied.id);
    QCOMPARE(pruned.at(1), rejected.id);
    QCOMPARE(queue.size(), static_cast<std::size_t>(2));
    QVERIFY(queue.find(failed.id)->state() == ReviewState::ApplyFailed);
    QVERIFY(queue.find(waiting.id)->state() == ReviewState::Proposed);
}

QTEST_GUILESS_MAIN(ApprovalWorkflowTest)
#include "ApprovalWorkflowTest.moc"
