#include "auth.hpp"

#include "../../common.hpp"
#include "wbcpp/webull/auth/canonicalize.hpp"
#include "wbcpp/webull/auth/errors.hpp"
#include "wbcpp/webull/auth/headers.hpp"
#include "wbcpp/webull/auth/session.hpp"
#include "wbcpp/webull/auth/sign_request.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"
#include "wbcpp/webull/auth/urlencode.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <map>
#include <nanobind/nanobind.h>
#include <string>
#include <string_view>
#include <utility>

using namespace wbcpp::webull::auth;

namespace wbcpp::bindings::python::webull::auth {

namespace {

[[nodiscard]] std::map<std::string, std::string> to_dict(const boost::beast::http::fields &fields) {
    std::map<std::string, std::string> ret;
    for (const auto &field : fields) {
        ret.emplace(field.name_string(), field.value());
    }
    return ret;
}

} // namespace

void _register(nanobind::module_ &_module) {
    nb::module_ auth = _module.def_submodule("auth");

    nb::exception<InvalidInputError>(auth, "InvalidInputError", PyExc_ValueError);
    nb::exception<EncodingError>(auth, "EncodingError", PyExc_ValueError);

    nb::class_<SignatureRequest>(auth, "SignatureRequest")
        .def(nb::init<>())
        .def_rw("uri_path", &SignatureRequest::uri_path)
        // the getter returns a copy, mutate through add_query_parameter or assign a new list
        .def_rw("query_parameters", &SignatureRequest::query_parameters)
        .def(
            "add_query_parameter",
            [](SignatureRequest &request, std::string name, std::string value) {
                request.query_parameters.emplace_back(std::move(name), std::move(value));
            },
            nb::arg("name"), nb::arg("value"))
        .def_rw("timestamp", &SignatureRequest::timestamp)
        .def_rw("nonce", &SignatureRequest::nonce)
        .def_rw("app_key", &SignatureRequest::app_key)
        .def_rw("signature_algorithm", &SignatureRequest::signature_algorithm)
        .def_rw("signature_version", &SignatureRequest::signature_version)
        .def_rw("host", &SignatureRequest::host)
        .def_prop_rw(
            "body",
            [](const SignatureRequest &request) {
                return nb::bytes(request.body.data(), request.body.size());
            },
            [](SignatureRequest &request, const nb::bytes &body) {
                request.body.assign(body.c_str(), body.size());
            });

    nb::class_<CanonicalRequest>(auth, "CanonicalRequest")
        .def_ro("parameters", &CanonicalRequest::parameters)
        .def_ro("body_digest", &CanonicalRequest::body_digest)
        .def_ro("string_to_sign", &CanonicalRequest::string_to_sign)
        .def_ro("encoded", &CanonicalRequest::encoded);

    auth.def("urlencode", &urlencode, nb::arg("input"));
    auth.def(
        "body_digest",
        [](const nb::bytes &body) { return body_digest(std::string_view{body.c_str(), body.size()}); },
        nb::arg("body"));
    auth.def("canonicalize_request", &canonicalize_request, nb::arg("request"));
    auth.def("sign", &sign, nb::arg("request"), nb::arg("app_secret"));
    auth.def("sign_canonical", &sign_canonical, nb::arg("encoded"), nb::arg("app_secret"));
    auth.def(
        "make_signature_headers",
        [](const SignatureRequest &request, std::string_view signature) {
            return to_dict(make_signature_headers(request, signature));
        },
        nb::arg("request"), nb::arg("signature"));
    auth.def(
        "signed_headers",
        [](const SignatureRequest &request, std::string_view app_secret) {
            return to_dict(signed_headers(request, app_secret));
        },
        nb::arg("request"), nb::arg("app_secret"));
    auth.def("format_timestamp", [] { return format_timestamp(std::chrono::system_clock::now()); });
    auth.def("generate_nonce", &generate_nonce);
}

} // namespace wbcpp::bindings::python::webull::auth
