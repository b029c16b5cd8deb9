#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "app/config_types.hpp"

namespace md5mux::app {

Stats calc_stats(std::vector<double> values);
double to_gbps(uint64_t bytes, double sec);
uint64_t xorshift64(uint64_t& s);

}  // namespace md5mux::app
