#pragma once

#include "flagpole/core/flag_errors.h"
#include "flagpole/core/flag_space.h"
#include "flagpole/core/handler_binding.h"
#include "flagpole/core/dependency_resolver.h"
#include "flagpole/core/flag_registry.h"
#include "flagpole/utils/logging.hpp"
#include "flagpole/utils/result.hpp"
