#include "webull.hpp"

#include "../common.hpp"
#include "auth/auth.hpp"

#include <nanobind/nanobind.h>

namespace wbcpp::bindings::python::webull {

void _register(nanobind::module_ &_module) {
    nb::module_ webull = _module.def_submodule("webull");

    auth::_register(webull);
}

} // namespace wbcpp::bindings::python::webull
