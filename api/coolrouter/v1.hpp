#pragma once

#include "coolrouter/router/v1/types.pb.h"
#include "coolrouter/router/v1/events.pb.h"

#include "coolrouter/router/services/v1/router_service.pb.h"
#include "coolrouter/router/services/v1/consumer_service.pb.h"

namespace coolrouter::v1 {
using namespace ::coolrouter::router::v1;
using namespace ::coolrouter::router::services::v1;
}
