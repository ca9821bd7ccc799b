#pragma once

#include "engine/Types.hpp"

#include <string>

namespace sw::rpc
{

class INotifier
{
  public:
    virtual ~INotifier() noexcept = default;

    virtual bool send_summary(engine::RunSummary const &summary) = 0;
    virtual bool send_error(std::string const &message) = 0;
};

} // namespace sw::rpc
