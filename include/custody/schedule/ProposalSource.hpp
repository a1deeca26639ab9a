#pragma once

#include <QFuture>
#include <QString>
#include <vector>

#include "custody/data/CareProvider.hpp"
#include "custody/data/TimeBlock.hpp"
#include "custody/schedule/ChangeBatch.hpp"

namespace custody {
namespace schedule {

struct ProposalRequest
{
    QString instruction;
    // Schedule the assistant may reference; original blocks in the reply must match it.
    std::vector<data::TimeBlock> context;
    QString requestedBy;
    data::CareProvider requesterRole = data::CareProvider::Unassigned;
};

// Turns an instruction into a batch of proposals, typically by calling out to an
// assistant. The engine never blocks on the returned future.
class ProposalSource
{
public:
    virtual ~ProposalSource() = default;

    virtual QFuture<ChangeBatch> requestBatch(const ProposalRequest &request) = 0;
};

} // namespace schedule
} // namespace custody
