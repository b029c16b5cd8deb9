#pragma once

#include <expected>

#include "md5mux/core/error.hpp"

namespace md5mux {

template <class T>
using Expected = std::expected<T, Error>;

}  // namespace md5mux
