#pragma once

#include <memory>
#include <core/types.hpp>
#include "transport.hpp"

// One concrete transport per configured protocol. Protocols that are known
// for policy purposes but have no transport in this build yield an error.
Result<std::unique_ptr<Transport>> create_transport(const DeploymentConfig& config);
