#pragma once

#include "planner/v1/types.pb.h"
#include "planner/v1/commands.pb.h"
#include "planner/v1/events.pb.h"
#include "planner/v1/state.pb.h"
#include "planner/v1/session.pb.h"

#include "planner/v1/daemon_service.pb.h"
#include "planner/v1/daemon_service.grpc.pb.h"
