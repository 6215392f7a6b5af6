#pragma once

#include "graphflow/core/v1/graph.pb.h"
#include "graphflow/core/v1/invocation.pb.h"
#include "graphflow/core/v1/record.pb.h"

#include "graphflow/services/v1/graph_service.pb.h"

namespace graphflow::v1 {
using namespace ::graphflow::core::v1;
using namespace ::graphflow::services::v1;
}
