#include "custody/core/MutationLog.hpp"

#include "custody/core/MutationCommand.hpp"

namespace custody {
namespace core {

MutationLog::MutationLog() = default;

MutationLog::~MutationLog() = default;

void MutationLog::push(std::unique_ptr<MutationCommand> command)
{
    if (!command) {
        return;
    }
    command->apply();
    m_commands.push_back(std::move(command));
}

bool MutationLog::isEmpty() const
{
    return m_commands.empty();
}

std::size_t MutationLog::count() const
{
    return m_commands.size();
}

void MutationLog::rollback()
{
    while (!m_commands.empty()) {
        m_commands.back()->revert();
        m_commands.pop_back();
    }
}

void MutationLog::clear()
{
    m_commands.clear();
}

} // namespace core
} // namespace custody
