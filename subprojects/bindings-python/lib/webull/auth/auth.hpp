#pragma once

#include <nanobind/nanobind.h>

namespace wbcpp::bindings::python::webull::auth {

void _register(nanobind::module_ &_module);

} // namespace wbcpp::bindings::python::webull::auth
