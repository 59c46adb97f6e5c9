#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace routebroker::db::model {

/*
  One dispatch of a route computation.

  id is the task id known to the execution subsystem. The job carries no
  status column: state is always queried live by id.
*/

struct JobRecord {
  std::string     id;
  util::TimePoint created{};
  int64_t         route_id = 0;
};

} // namespace routebroker::db::model
