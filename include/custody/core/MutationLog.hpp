#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace custody {
namespace core {

class MutationCommand;

// Records applied commands so a transaction can be unwound in reverse order.
class MutationLog
{
public:
    MutationLog();
    ~MutationLog();

    void push(std::unique_ptr<MutationCommand> command);
    bool isEmpty() const;
    std::size_t count() const;

    // Reverts every recorded command, newest first, and empties the log.
    void rollback();
    // Forgets the recorded commands without reverting them.
    void clear();

private:
    std::vector<std::unique_ptr<MutationCommand>> m_commands;
};

} // namespace core
} // namespace custody
