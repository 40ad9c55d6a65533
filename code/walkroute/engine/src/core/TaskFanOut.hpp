#pragma once
#include "core/RouteBuilder.hpp"
#include <optional>
#include <vector>

// Launches every task, then waits for them in declaration order. Slot i of
// the result always belongs to tasks[i], whichever task finished first. A
// task that throws leaves its slot empty and is logged under `tag`.
//
// parallel=false defers every task onto the calling thread, which then runs
// them one after another.
std::vector<std::optional<Route>> run_route_tasks(std::vector<RouteTask> tasks,
                                                  bool parallel,
                                                  const char *tag);
