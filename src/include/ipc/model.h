#pragma once

#include "model/modify_settings.h"
#include "model/operation.h"
#include "model/operation_type.h"
#include "model/remove_history.h"
#include "model/task_target.h"
