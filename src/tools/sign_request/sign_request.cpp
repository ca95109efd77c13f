#include "wbcpp/webull/auth/canonicalize.hpp"
#include "wbcpp/webull/auth/errors.hpp"
#include "wbcpp/webull/auth/headers.hpp"
#include "wbcpp/webull/auth/session.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] std::string file_to_string(const std::filesystem::path &path) {
    const std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        std::println(std::cerr, "failed to open {}", path.string());
        exit(1);
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

struct Options {
    std::string app_key;
    std::string app_secret;
    std::string path;
    std::string host;
    std::vector<std::string> query;
    std::string body_file;
    std::string timestamp;
    std::string nonce;
    bool verbose{};
};

[[nodiscard]] Options parse_opts(int argc, char **argv) {

    Options ret;

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("app-key-file", boost::program_options::value<std::string>(&ret.app_key)->required(), "path to app key file")
        ("app-secret-file", boost::program_options::value<std::string>(&ret.app_secret)->required(), "path to app secret file")
        ("path,p", boost::program_options::value<std::string>(&ret.path)->required(), "request path, without query")
        ("host", boost::program_options::value<std::string>(&ret.host)->default_value("api.webull.com"), "API host")
        ("query,q", boost::program_options::value<std::vector<std::string>>(&ret.query)->composing(), "query parameter as name=value, repeatable")
        ("body-file,b", boost::program_options::value<std::string>(&ret.body_file), "path to request body, sent verbatim")
        ("timestamp", boost::program_options::value<std::string>(&ret.timestamp), "ISO-8601 UTC timestamp, defaults to now")
        ("nonce", boost::program_options::value<std::string>(&ret.nonce), "signature nonce, defaults to a random one")
        ("verbose,v", boost::program_options::bool_switch(&ret.verbose), "print the canonical strings to stderr")
    ;
    // clang-format on

    boost::program_options::variables_map varmap;
    try {
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, descr), varmap);
        if (varmap.contains("help")) {
            std::println("sign a Webull OpenAPI request\n"
                         "prints the headers to attach to it\n");
            std::cout << descr << '\n';
            exit(0);
        }
        boost::program_options::notify(varmap);
    } catch (const boost::program_options::error &err) {
        std::println(std::cerr, "{}", err.what());
        std::cerr << descr << '\n';
        exit(1);
    }

    ret.app_key = file_to_string(ret.app_key);
    ret.app_secret = file_to_string(ret.app_secret);
    boost::algorithm::trim(ret.app_key);
    boost::algorithm::trim(ret.app_secret);

    return ret;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    const Options options = parse_opts(argc, argv);

    wbcpp::webull::auth::SignatureRequest request{
        .uri_path = options.path,
        .query_parameters = {},
        .timestamp = options.timestamp.empty()
                         ? wbcpp::webull::auth::format_timestamp(std::chrono::system_clock::now())
                         : options.timestamp,
        .nonce = options.nonce.empty() ? wbcpp::webull::auth::generate_nonce() : options.nonce,
        .app_key = options.app_key,
        .host = options.host,
        .body = options.body_file.empty() ? std::string{} : file_to_string(options.body_file),
    };

    for (const std::string &param : options.query) {
        const auto separator = param.find('=');
        if (separator == std::string::npos) {
            std::println(std::cerr, "query parameter '{}' is not name=value", param);
            return 1;
        }
        request.query_parameters.emplace_back(param.substr(0, separator), param.substr(separator + 1));
    }

    try {
        if (options.verbose) {
            const auto canonical = wbcpp::webull::auth::canonicalize_request(request);
            std::println(std::cerr, "str1: {}", canonical.parameters);
            std::println(std::cerr, "str2: {}", canonical.body_digest);
            std::println(std::cerr, "str3: {}", canonical.string_to_sign);
            std::println(std::cerr, "encoded: {}", canonical.encoded);
        }

        for (const auto &field : wbcpp::webull::auth::signed_headers(request, options.app_secret)) {
            std::println("{}: {}", std::string_view{field.name_string()}, std::string_view{field.value()});
        }
    } catch (const wbcpp::webull::auth::InvalidInputError &err) {
        std::println(std::cerr, "invalid request: {}", err.what());
        return 1;
    }
}
