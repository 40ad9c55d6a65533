#pragma once
#include <string>

// Random (version 4) UUID string, e.g. "3f1c0a9e-5b7d-4e2a-9c1f-0d6b8e4a2c71".
std::string make_route_id();
