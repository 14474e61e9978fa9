#pragma once

#include "artifact/coordination/v1/worker_state.pb.h"
