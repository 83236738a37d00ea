#include "framework.h"

class test_wd_utils : public test_fixture
{
public:
    RTF_FIXTURE(test_wd_utils);
      TEST(test_wd_utils::test_string_utils_split);
      TEST(test_wd_utils::test_string_utils_split_whitespace);
      TEST(test_wd_utils::test_string_utils_strip);
      TEST(test_wd_utils::test_string_utils_contains);
      TEST(test_wd_utils::test_string_utils_is_integer);
      TEST(test_wd_utils::test_string_utils_s_to_int);
      TEST(test_wd_utils::test_string_utils_s_to_double);
      TEST(test_wd_utils::test_string_utils_format);
      TEST(test_wd_utils::test_exception_message);
      TEST(test_wd_utils::test_io_exception_errno);
      TEST(test_wd_utils::test_nullable);
      TEST(test_wd_utils::test_uuid);
      TEST(test_wd_utils::test_args);
      TEST(test_wd_utils::test_args_errors);
      TEST(test_wd_utils::test_logger_threshold_and_callback);
      TEST(test_wd_utils::test_socket_address);
      TEST(test_wd_utils::test_udp_send_recv);
      TEST(test_wd_utils::test_udp_recv_timeout);
      TEST(test_wd_utils::test_udp_join_group_rejects_unicast);
    RTF_FIXTURE_END();

    virtual ~test_wd_utils() throw() {}

    virtual void setup();
    virtual void teardown();

    void test_string_utils_split();
    void test_string_utils_split_whitespace();
    void test_string_utils_strip();
    void test_string_utils_contains();
    void test_string_utils_is_integer();
    void test_string_utils_s_to_int();
    void test_string_utils_s_to_double();
    void test_string_utils_format();
    void test_exception_message();
    void test_io_exception_errno();
    void test_nullable();
    void test_uuid();
    void test_args();
    void test_args_errors();
    void test_logger_threshold_and_callback();
    void test_socket_address();
    void test_udp_send_recv();
    void test_udp_recv_timeout();
    void test_udp_join_group_rejects_unicast();
};
