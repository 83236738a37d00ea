
#include "test_wd_utils.h"
#include "wd_utils/wd_string_utils.h"
#include "wd_utils/wd_exception.h"
#include "wd_utils/wd_nullable.h"
#include "wd_utils/wd_uuid.h"
#include "wd_utils/wd_args.h"
#include "wd_utils/wd_logger.h"
#include "wd_utils/wd_socket_address.h"
#include "wd_utils/wd_udp_socket.h"
#include <chrono>
#include <cmath>
#include <cstring>
#include <errno.h>
#include <set>
#include <utility>

using namespace std;
using namespace std::chrono;
using namespace wd_utils;

REGISTER_TEST_FIXTURE(test_wd_utils);

void test_wd_utils::setup()
{
    wd_logger::set_console_output(false);
}

void test_wd_utils::teardown()
{
    wd_logger::clear_log_callback();
    wd_logger::set_log_level(wd_logger::LOG_LEVEL_WARNING);
    wd_logger::set_console_output(true);
}

void test_wd_utils::test_string_utils_split()
{
    {
        auto parts = wd_string_utils::split("This is a test string.", ' ');
        RTF_ASSERT(parts.size() == 5);
        RTF_ASSERT(parts[0] == "This");
        RTF_ASSERT(parts[4] == "string.");
    }
    {
        auto parts = wd_string_utils::split("first line\n\nsecond line\n", '\n');
        RTF_ASSERT(parts.size() == 2);
        RTF_ASSERT(parts[0] == "first line");
        RTF_ASSERT(parts[1] == "second line");
    }
    {
        auto parts = wd_string_utils::split("no delimiter", ',');
        RTF_ASSERT(parts.size() == 1);
        RTF_ASSERT(parts[0] == "no delimiter");
    }
    RTF_ASSERT(wd_string_utils::split("", '\n').empty());
    RTF_ASSERT(wd_string_utils::split("\n\n", '\n').empty());
}

void test_wd_utils::test_string_utils_split_whitespace()
{
    {
        auto parts = wd_string_utils::split_whitespace("  http://10.0.0.5/onvif/device_service\n\thttp://[fe80::1]/onvif/device_service  ");
        RTF_ASSERT(parts.size() == 2);
        RTF_ASSERT(parts[0] == "http://10.0.0.5/onvif/device_service");
        RTF_ASSERT(parts[1] == "http://[fe80::1]/onvif/device_service");
    }
    {
        auto parts = wd_string_utils::split_whitespace("dn:NetworkVideoTransmitter tds:Device");
        RTF_ASSERT(parts.size() == 2);
        RTF_ASSERT(parts[0] == "dn:NetworkVideoTransmitter");
        RTF_ASSERT(parts[1] == "tds:Device");
    }
    RTF_ASSERT(wd_string_utils::split_whitespace("").empty());
    RTF_ASSERT(wd_string_utils::split_whitespace(" \r\n\t ").empty());
    RTF_ASSERT(wd_string_utils::split_whitespace("single").size() == 1);
}

void test_wd_utils::test_string_utils_strip()
{
    RTF_ASSERT(wd_string_utils::strip("  uuid:abc \n") == "uuid:abc");
    RTF_ASSERT(wd_string_utils::lstrip("\t x ") == "x ");
    RTF_ASSERT(wd_string_utils::rstrip("\t x \r\n") == "\t x");
    RTF_ASSERT(wd_string_utils::strip("") == "");
    RTF_ASSERT(wd_string_utils::strip("   ") == "");
}

void test_wd_utils::test_string_utils_contains()
{
    RTF_ASSERT(wd_string_utils::contains("http://schemas.xmlsoap.org/ws/2005/04/discovery/ProbeMatches", "ProbeMatches"));
    RTF_ASSERT(!wd_string_utils::contains("http://schemas.xmlsoap.org/ws/2005/04/discovery/Bye", "Hello"));
    RTF_ASSERT(wd_string_utils::contains("x", ""));
}

void test_wd_utils::test_string_utils_is_integer()
{
    RTF_ASSERT(wd_string_utils::is_integer("1"));
    RTF_ASSERT(wd_string_utils::is_integer(" 42 "));
    RTF_ASSERT(wd_string_utils::is_integer("-7"));
    RTF_ASSERT(wd_string_utils::is_integer("+7"));
    RTF_ASSERT(!wd_string_utils::is_integer("-7", false));
    RTF_ASSERT(!wd_string_utils::is_integer(""));
    RTF_ASSERT(!wd_string_utils::is_integer("-"));
    RTF_ASSERT(!wd_string_utils::is_integer("abc"));
    RTF_ASSERT(!wd_string_utils::is_integer("1.5"));
    RTF_ASSERT(!wd_string_utils::is_integer("12a"));
}

void test_wd_utils::test_string_utils_s_to_int()
{
    RTF_ASSERT(wd_string_utils::s_to_int("10") == 10);
    RTF_ASSERT(wd_string_utils::s_to_int(" -3 ") == -3);
    RTF_ASSERT_THROWS(wd_string_utils::s_to_int("abc"), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(wd_string_utils::s_to_int("99999999999999999999"), wd_invalid_argument_exception);
}

void test_wd_utils::test_string_utils_s_to_double()
{
    RTF_ASSERT(fabs(wd_string_utils::s_to_double("5.0") - 5.0) < 0.0001);
    RTF_ASSERT(fabs(wd_string_utils::s_to_double(" 0.25 ") - 0.25) < 0.0001);
    RTF_ASSERT(fabs(wd_string_utils::s_to_double("3") - 3.0) < 0.0001);
    RTF_ASSERT_THROWS(wd_string_utils::s_to_double("five"), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(wd_string_utils::s_to_double("5s"), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(wd_string_utils::s_to_double(""), wd_invalid_argument_exception);
}

void test_wd_utils::test_string_utils_format()
{
    RTF_ASSERT(wd_string_utils::format("%s:%d", "10.0.0.5", 3702) == "10.0.0.5:3702");
    RTF_ASSERT(wd_string_utils::format("Discovered %zu ONVIF device(s)", (size_t)2) == "Discovered 2 ONVIF device(s)");

    string big(4096, 'x');
    RTF_ASSERT(wd_string_utils::format("%s", big.c_str()).size() == 4096);
}

void test_wd_utils::test_exception_message()
{
    try
    {
        WD_STHROW(wd_io_exception, ("Unable to bind to %s:%d", "0.0.0.0", 0));
        RTF_ASSERT(false);
    }
    catch(const wd_exception& ex)
    {
        RTF_ASSERT(string(ex.what()) == "Unable to bind to 0.0.0.0:0");
    }

    try
    {
        WD_THROW(("plain %d", 1));
        RTF_ASSERT(false);
    }
    catch(const wd_exception& ex)
    {
        RTF_ASSERT(string(ex.what()) == "plain 1");
    }

    RTF_ASSERT_THROWS(WD_STHROW(wd_internal_exception, ("x")), wd_exception);
    RTF_ASSERT_THROWS(WD_STHROW(wd_invalid_argument_exception, ("x")), wd_exception);
}

void test_wd_utils::test_io_exception_errno()
{
    try
    {
        errno = ECONNREFUSED;
        WD_THROW_ERRNO(("recvfrom() on %s failed", "0.0.0.0:3702"));
        RTF_ASSERT(false);
    }
    catch(const wd_io_exception& ex)
    {
        RTF_ASSERT(ex.error_code() == ECONNREFUSED);
        RTF_ASSERT(string(ex.what()) == string("recvfrom() on 0.0.0.0:3702 failed: ") + strerror(ECONNREFUSED));
    }

    // Not an address of this host.
    wd_udp_socket sok;
    try
    {
        sok.bind(wd_socket_address(0, "203.0.113.77"));
        RTF_ASSERT(false);
    }
    catch(const wd_io_exception& ex)
    {
        RTF_ASSERT(ex.error_code() == EADDRNOTAVAIL);
        RTF_ASSERT(wd_string_utils::contains(ex.what(), "Unable to bind to 203.0.113.77:0"));
    }

    RTF_ASSERT(wd_io_exception("short send").error_code() == 0);
}

void test_wd_utils::test_nullable()
{
    wd_nullable<int> a;
    RTF_ASSERT(a.is_null());
    RTF_ASSERT(!a);
    RTF_ASSERT(a.value_or(7) == 7);
    RTF_ASSERT_THROWS(a.value(), wd_exception);

    a.set_value(3);
    RTF_ASSERT(!a.is_null());
    RTF_ASSERT(a.value() == 3);
    RTF_ASSERT(a == 3);
    RTF_ASSERT(a != 4);

    wd_nullable<int> b(3);
    RTF_ASSERT(a == b);

    wd_nullable<int> c = std::move(b);
    RTF_ASSERT(c.value() == 3);
    RTF_ASSERT(b.is_null());

    c.clear();
    RTF_ASSERT(c.is_null());
    RTF_ASSERT(c == wd_nullable<int>());

    wd_nullable<string> s;
    RTF_ASSERT(s != string("uuid:abc"));
    s = string("uuid:abc");
    RTF_ASSERT(s == string("uuid:abc"));
}

void test_wd_utils::test_uuid()
{
    auto a = wd_uuid::generate();
    auto b = wd_uuid::generate();

    RTF_ASSERT(a.size() == 36);
    RTF_ASSERT(a[8] == '-' && a[13] == '-' && a[18] == '-' && a[23] == '-');
    RTF_ASSERT(a[14] == '4');
    RTF_ASSERT(string("89ab").find(a[19]) != string::npos);
    RTF_ASSERT(a.find_first_of("ABCDEF") == string::npos);
    RTF_ASSERT(a != b);

    set<string> seen;
    for(int i = 0; i < 1000; ++i)
        seen.insert(wd_uuid::generate());
    RTF_ASSERT(seen.size() == 1000);
}

static const vector<wd_args::option> TEST_OPTIONS = {
    {"--timeout", "-t", true},
    {"--interface", "-i", true},
    {"--listen-hello", "", false},
    {"--verbose", "-v", false}
};

static wd_args::parsed_options _parse_args(vector<const char*> argv)
{
    argv.insert(argv.begin(), "wd_validator");
    return wd_args::parse_arguments((int)argv.size(), (char**)argv.data(), TEST_OPTIONS);
}

void test_wd_utils::test_args()
{
    {
        auto args = _parse_args({"--timeout", "2.5", "-v", "--interface=192.168.1.10", "--listen-hello"});

        RTF_ASSERT(args.size() == 4);
        RTF_ASSERT(wd_args::value_of(args, "--timeout").value() == "2.5");
        RTF_ASSERT(wd_args::value_of(args, "--interface").value() == "192.168.1.10");
        RTF_ASSERT(wd_args::has(args, "--verbose"));
        RTF_ASSERT(wd_args::has(args, "--listen-hello"));
        RTF_ASSERT(wd_args::value_of(args, "--listen-hello").is_null());
    }
    {
        // short names are stored under the long name, and the last one wins
        auto args = _parse_args({"-t", "1", "--timeout", "3"});
        RTF_ASSERT(args.size() == 1);
        RTF_ASSERT(wd_args::value_of(args, "--timeout").value() == "3");
        RTF_ASSERT(!wd_args::has(args, "-t"));
    }
    {
        // a value may start with '-', so range checks see it
        auto args = _parse_args({"--timeout", "-1"});
        RTF_ASSERT(wd_args::value_of(args, "--timeout").value() == "-1");
    }
    {
        auto args = _parse_args({});
        RTF_ASSERT(args.empty());
        RTF_ASSERT(!wd_args::has(args, "--verbose"));
        RTF_ASSERT(wd_args::value_of(args, "--timeout").is_null());
    }
}

void test_wd_utils::test_args_errors()
{
    RTF_ASSERT_THROWS(_parse_args({"--bogus"}), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(_parse_args({"-x"}), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(_parse_args({"positional"}), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(_parse_args({"--timeout"}), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(_parse_args({"--timeout="}), wd_invalid_argument_exception);
    RTF_ASSERT_THROWS(_parse_args({"--verbose=yes"}), wd_invalid_argument_exception);

    try
    {
        _parse_args({"-v", "--listen_hello"});
        RTF_ASSERT(false);
    }
    catch(const wd_invalid_argument_exception& ex)
    {
        RTF_ASSERT(string(ex.what()) == "Unrecognized option: --listen_hello");
    }
}

void test_wd_utils::test_logger_threshold_and_callback()
{
    vector<pair<wd_logger::LOG_LEVEL, string>> seen;
    wd_logger::set_log_callback([&seen](wd_logger::LOG_LEVEL level, const string& msg){
        seen.push_back(make_pair(level, msg));
    });

    wd_logger::set_log_level(wd_logger::LOG_LEVEL_WARNING);
    WD_LOG_INFO("dropped %d", 1);
    WD_LOG_DEBUG("dropped %d", 2);
    WD_LOG_WARNING("kept %d", 3);
    WD_LOG_ERROR("first line\nsecond line");

    RTF_ASSERT(seen.size() == 3);
    RTF_ASSERT(seen[0].first == wd_logger::LOG_LEVEL_WARNING);
    RTF_ASSERT(seen[0].second == "kept 3");
    RTF_ASSERT(seen[1].second == "first line");
    RTF_ASSERT(seen[2].second == "second line");

    seen.clear();
    wd_logger::set_log_level(wd_logger::LOG_LEVEL_DEBUG);
    RTF_ASSERT(wd_logger::get_log_level() == wd_logger::LOG_LEVEL_DEBUG);
    WD_LOG_DEBUG("now visible");
    RTF_ASSERT(seen.size() == 1);

    RTF_ASSERT(string(wd_logger::level_name(wd_logger::LOG_LEVEL_NOTICE)) == "NOTICE");
}

void test_wd_utils::test_socket_address()
{
    {
        wd_socket_address group(3702, "239.255.255.250");
        RTF_ASSERT(group.port() == 3702);
        RTF_ASSERT(group.address() == "239.255.255.250");
        RTF_ASSERT(group.is_multicast());
        RTF_ASSERT(group.to_string() == "239.255.255.250:3702");
        RTF_ASSERT(ntohs(((struct sockaddr_in*)group.get_sock_addr())->sin_port) == 3702);
    }
    {
        wd_socket_address any(0);
        RTF_ASSERT(any.address() == "0.0.0.0");
        RTF_ASSERT(any.ipv4_addr().s_addr == htonl(INADDR_ANY));
        RTF_ASSERT(!any.is_multicast());
    }
    {
        wd_socket_address local(5000, "127.0.0.1");
        wd_socket_address copy(local.get_sock_addr(), local.sock_addr_size());
        RTF_ASSERT(copy.address() == "127.0.0.1");
        RTF_ASSERT(copy.port() == 5000);
    }

    RTF_ASSERT_THROWS(wd_socket_address(0, "no.such.host.invalid"), wd_invalid_argument_exception);

    RTF_ASSERT(wd_socket_address::is_ipv4("10.1.2.3"));
    RTF_ASSERT(!wd_socket_address::is_ipv4("10.1.2"));
    RTF_ASSERT(!wd_socket_address::is_ipv4("eth0"));
    RTF_ASSERT(!wd_socket_address::is_ipv4(""));
}

void test_wd_utils::test_udp_send_recv()
{
    int port = RTF_NEXT_PORT();

    wd_udp_socket server;
    server.set_reuse_address(true);
    server.set_recv_buffer_size(65536);
    server.bind(wd_socket_address(port, "127.0.0.1"));
    RTF_ASSERT(server.get_bound_port() == port);

    wd_udp_socket client;
    client.bind(wd_socket_address(0, "127.0.0.1"));
    int client_port = client.get_bound_port();
    RTF_ASSERT(client_port > 0);

    string msg = "<Envelope/>";
    RTF_ASSERT(client.sendto((const uint8_t*)msg.data(), msg.size(), wd_socket_address(port, "127.0.0.1")) == msg.size());

    vector<uint8_t> buffer;
    wd_socket_address from(0);
    RTF_ASSERT(server.recvfrom(buffer, from, 2000));
    RTF_ASSERT(string((const char*)buffer.data(), buffer.size()) == msg);
    RTF_ASSERT(from.address() == "127.0.0.1");
    RTF_ASSERT(from.port() == client_port);
}

void test_wd_utils::test_udp_recv_timeout()
{
    wd_udp_socket sok;
    sok.bind(wd_socket_address(0, "127.0.0.1"));

    vector<uint8_t> buffer;
    wd_socket_address from(0);

    auto before = steady_clock::now();
    RTF_ASSERT(!sok.recvfrom(buffer, from, 200));
    auto waited = duration_cast<milliseconds>(steady_clock::now() - before).count();

    RTF_ASSERT(waited >= 150);
    RTF_ASSERT(waited < 2000);
}

void test_wd_utils::test_udp_join_group_rejects_unicast()
{
    wd_udp_socket sok;
    RTF_ASSERT_THROWS(sok.join_group(wd_socket_address(3702, "127.0.0.1"), wd_socket_address(0)), wd_invalid_argument_exception);
}
