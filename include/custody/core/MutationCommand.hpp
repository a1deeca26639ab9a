#pragma once

namespace custody {
namespace core {

class MutationCommand
{
public:
    virtual ~MutationCommand() = default;
    virtual void apply() = 0;
    virtual void revert() = 0;
};

} // namespace core
} // namespace custody
