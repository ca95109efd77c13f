#include "common.hpp"
#include "webull/webull.hpp"

#include <nanobind/nanobind.h>
#include <nanobind/nb_defs.h>

using namespace wbcpp::bindings::python;

NB_MODULE(wbcpp, _module) { webull::_register(_module); }
