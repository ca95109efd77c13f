#pragma once

#include <nanobind/nanobind.h>

// IWYU pragma: begin_keep
#include <nanobind/stl/map.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>
// IWYU pragma: end_keep

namespace nb = nanobind;
