
#ifndef framework_h
#define framework_h

#include <cstdarg>
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

std::string rtf_format(const char* fmt, ...);
std::string rtf_format(const char* fmt, va_list& args);
void rtf_usleep(unsigned int usec);
int rtf_next_port();

class rtf_exception : public std::exception
{
public:
    rtf_exception(const std::string& msg, const char* file, int line) :
        _msg(rtf_format("%s (%s:%d)", msg.c_str(), file, line))
    {
    }

    virtual ~rtf_exception() noexcept {}

    virtual const char* what() const noexcept { return _msg.c_str(); }

private:
    std::string _msg;
};

class test_fixture
{
public:
    virtual ~test_fixture() noexcept {}

    virtual void setup() {}
    virtual void teardown() {}

    // Provided by RTF_FIXTURE() / RTF_FIXTURE_END(). An empty name runs every test.
    virtual int run_tests(const std::string& full_test_name) = 0;

    bool something_failed() const { return !_failures.empty(); }

    void print_failures() const
    {
        for(auto& f : _failures)
            printf("\nFAILED: %s\n    %s\n", f.first.c_str(), f.second.c_str());
        fflush(stdout);
    }

    const std::string& get_name() const { return _name; }

protected:
    int _run_one(const std::string& test_name, const std::string& full_test_name, const std::function<void()>& test)
    {
        if(!full_test_name.empty() && full_test_name != test_name)
            return 0;

        printf("%s\n", test_name.c_str());
        fflush(stdout);

        try
        {
            setup();
        }
        catch(std::exception& ex)
        {
            _failures.push_back(std::make_pair(test_name, std::string("setup(): ") + ex.what()));
            return 1;
        }

        try
        {
            test();
        }
        catch(std::exception& ex)
        {
            _failures.push_back(std::make_pair(test_name, std::string(ex.what())));
        }

        try
        {
            teardown();
        }
        catch(std::exception& ex)
        {
            _failures.push_back(std::make_pair(test_name, std::string("teardown(): ") + ex.what()));
        }

        return 1;
    }

    std::string _name;
    std::vector<std::pair<std::string, std::string>> _failures;
};

std::vector<std::shared_ptr<test_fixture>>& rtf_test_fixtures();

#define RTF_FIXTURE(a) \
    virtual int run_tests(const std::string& full_test_name) override \
    { \
        _name = #a; \
        int tests_run = 0;

#define TEST(a) \
        tests_run += _run_one(#a, full_test_name, [this](){ this->a(); });

#define RTF_FIXTURE_END() \
        return tests_run; \
    }

#define REGISTER_TEST_FIXTURE(a) \
    static struct a##_registrar \
    { \
        a##_registrar() { rtf_test_fixtures().push_back(std::make_shared<a>()); } \
    } a##_registrar_instance

#define RTF_ASSERT(a) \
    do { \
        if(!(a)) \
            throw rtf_exception(#a, __FILE__, __LINE__); \
    } while(false)

#define RTF_ASSERT_NO_THROW(a) \
    do { \
        try { a; } \
        catch(std::exception& rtf_ex) { throw rtf_exception(rtf_format("%s threw: %s", #a, rtf_ex.what()), __FILE__, __LINE__); } \
    } while(false)

#define RTF_ASSERT_THROWS(a, T) \
    do { \
        bool rtf_threw = false; \
        try { a; } \
        catch(T&) { rtf_threw = true; } \
        if(!rtf_threw) \
            throw rtf_exception(rtf_format("%s did not throw %s", #a, #T), __FILE__, __LINE__); \
    } while(false)

#define RTF_NEXT_PORT() rtf_next_port()

#endif
