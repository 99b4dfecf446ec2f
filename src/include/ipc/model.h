#pragma once

#include "model/modify_settings.h"
#include "model/operation.h"
#include "model/operation_type.h"
#include "model/stop_transfer.h"
