#pragma once

#include "config/CoordinatorOptions.hpp"
#include "coordinator/StateCoordinator.hpp"
#include "core/Clock.hpp"
#include "core/Error.hpp"
#include "lock/LockManager.hpp"
#include "path/PathResolver.hpp"
#include "path/SessionId.hpp"
#include "schema/StateSchema.hpp"
