#pragma once

#include "feedback/feedback.h"
#include "feedback/feedback_type.h"
#include "feedback/operation_failed.h"
