#pragma once

#include <string>

#include "graphflow/v1.hpp"

namespace graphflow::model {

/*
  Record construction helpers for node functions.

  Every record gets a fresh id; node functions never reuse or mutate the
  id of their input.
*/

graphflow::v1::Record MakeRecord(std::string payload);
graphflow::v1::Record MakeRecord(const google::protobuf::Message& message);

} // namespace graphflow::model
