
#include "wd_utils/wd_args.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_logger.h"
#include "wd_utils/wd_socket_address.h"
#include "wd_utils/wd_string_utils.h"
#include "wd_discovery/wd_diagnostic_sink.h"
#include "wd_discovery/wd_report.h"
#include "wd_discovery/wd_session.h"
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using namespace wd_utils;
using namespace wd_discovery;
using namespace std;
using namespace std::chrono;

static const double DEFAULT_TIMEOUT_SECONDS = 5.0;

static const int EXIT_BAD_ARGUMENTS = 2;

struct validator_options
{
    milliseconds timeout {timeout_from_seconds(DEFAULT_TIMEOUT_SECONDS)};
    bool listen_hello {false};
    string bind_interface;
    bool verbose {false};
    bool debug {false};
};

static void _usage(FILE* f)
{
    fprintf(f,
        "usage: wd_validator [options]\n"
        "\n"
        "Sends one WS-Discovery Probe for ONVIF NetworkVideoTransmitter devices and\n"
        "prints what answered as a JSON report on stdout.\n"
        "\n"
        "  -t, --timeout <seconds>   How long to listen after the Probe (default %.1f,\n"
        "                            at most %.0f).\n"
        "      --listen-hello        Also report Hello announcements.\n"
        "  -i, --interface <ipv4>    Send and listen on this interface.\n"
        "  -v, --verbose             Log progress to stderr.\n"
        "  -d, --debug               Log raw XML and rejected datagrams (implies -v).\n"
        "  -h, --help                Show this message.\n"
        "\n"
        "Exit status is 0 when at least one device was discovered, 1 otherwise.\n",
        DEFAULT_TIMEOUT_SECONDS,
        MAX_DISCOVERY_TIMEOUT_SECONDS
    );
}

static const vector<wd_args::option> OPTIONS = {
    {"--timeout", "-t", true},
    {"--listen-hello", "", false},
    {"--interface", "-i", true},
    {"--verbose", "-v", false},
    {"--debug", "-d", false},
    {"--help", "-h", false}
};

static validator_options _parse_options(const wd_args::parsed_options& args)
{
    validator_options opts;

    auto timeout = wd_args::value_of(args, "--timeout");
    if(timeout)
        opts.timeout = timeout_from_seconds(wd_string_utils::s_to_double(timeout.value()));

    auto iface = wd_args::value_of(args, "--interface");
    if(iface)
    {
        if(!wd_socket_address::is_ipv4(iface.value()))
            WD_STHROW(wd_invalid_argument_exception, ("Interface must be an IPv4 address: %s", iface.value().c_str()));
        opts.bind_interface = iface.value();
    }

    opts.listen_hello = wd_args::has(args, "--listen-hello");
    opts.debug = wd_args::has(args, "--debug");
    opts.verbose = opts.debug || wd_args::has(args, "--verbose");

    return opts;
}

// Always yields a JSON document, even if the full report cannot be rendered.
static string _render(const discovery_report& report)
{
    try
    {
        return wd_report::render_report(report);
    }
    catch(const std::exception& ex)
    {
        WD_LOG_EXCEPTION(ex);

        discovery_report fallback;
        fallback.correlation_id = report.correlation_id;
        fallback.message = "Discovery report could not be rendered";
        fallback.errors.push_back(ex.what());
        return wd_report::render_report(fallback);
    }
}

int main(int argc, char* argv[])
{
    wd_logger::install_terminate();
    wd_logger::set_console_output(true);

    validator_options opts;

    try
    {
        auto args = wd_args::parse_arguments(argc, argv, OPTIONS);

        if(wd_args::has(args, "--help"))
        {
            _usage(stdout);
            return 0;
        }

        opts = _parse_options(args);
    }
    catch(const wd_invalid_argument_exception& ex)
    {
        fprintf(stderr, "wd_validator: %s\n\n", ex.what());
        _usage(stderr);
        return EXIT_BAD_ARGUMENTS;
    }

    if(opts.debug)
        wd_logger::set_log_level(wd_logger::LOG_LEVEL_DEBUG);
    else if(opts.verbose)
        wd_logger::set_log_level(wd_logger::LOG_LEVEL_INFO);

    WD_LOG_INFO(
        "Starting discovery: timeout=%lldms listen_hello=%s interface=%s",
        (long long)opts.timeout.count(),
        (opts.listen_hello) ? "true" : "false",
        (opts.bind_interface.empty()) ? "any" : opts.bind_interface.c_str()
    );

    discovery_report report;

    try
    {
        wd_logger_sink sink;
        wd_discovery_session session(sink);

        report = session.run(
            opts.timeout,
            opts.listen_hello,
            opts.bind_interface
        );
    }
    catch(const std::exception& ex)
    {
        WD_LOG_EXCEPTION(ex);

        report.succeeded = false;
        report.message = string("Discovery failed: ") + ex.what();
        report.errors.push_back(ex.what());
    }

    printf("%s\n", _render(report).c_str());
    fflush(stdout);

    return (report.succeeded) ? 0 : 1;
}
