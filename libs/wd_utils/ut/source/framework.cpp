#include "framework.h"
#include <stdarg.h>
#include <stdlib.h>
#include <time.h>
#include <sys/time.h>
#include <unistd.h>

using namespace std;

vector<shared_ptr<test_fixture>>& rtf_test_fixtures() {
  static vector<shared_ptr<test_fixture>> fixtures;
  return fixtures;
}

void rtf_usleep(unsigned int usec) {
  usleep(usec);
}

string rtf_format(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  const string result = rtf_format(fmt, args);
  va_end(args);
  return result;
}

string rtf_format(const char* fmt, va_list& args) {
  va_list newargs;
  va_copy(newargs, args);
  const int chars_written = vsnprintf(nullptr, 0, fmt, newargs);
  const int len = chars_written + 1;

  vector<char> str(len);

  va_end(newargs);

  va_copy(newargs, args);

  vsnprintf(&str[0], len, fmt, newargs);

  va_end(newargs);

  return string(&str[0]);
}

// This is a globally (across test) incrementing counter so that tests can avoid
// having hardcoded port numbers but can avoid stepping on eachothers ports.
int _next_port = 15000;

int rtf_next_port() {
  int ret = _next_port;
  _next_port++;
  return ret;
}

void handle_terminate() {
  printf("\nuncaught exception terminate handler called!\n");
  fflush(stdout);

  std::exception_ptr p = std::current_exception();

  if (p) {
    try {
      std::rethrow_exception(p);
    } catch (std::exception& ex) {
      printf("caught an exception in custom terminate handler: %s, %s:%d\n",
             ex.what(), __FILE__, __LINE__);
    } catch (...) {
      printf("caught an unknown exception in custom terminate handler.\n");
    }
  }

  abort();
}

int main(int argc, char* argv[]) {
  set_terminate(handle_terminate);

  std::string fixture_name = "";
  std::string test_name = "";
  std::string full_test_name = "";

  // Accepts "fixture", "fixture test" or "fixture::test".
  if (argc > 1) {
    std::string arg1 = argv[1];

    size_t pos = arg1.find("::");
    if (pos != std::string::npos) {
      fixture_name = arg1.substr(0, pos);
      test_name = arg1.substr(pos + 2);
      full_test_name = arg1;
    } else {
      fixture_name = arg1;
      if (argc > 2) {
        test_name = argv[2];
        full_test_name = fixture_name + "::" + test_name;
      }
    }
  }

  if (!fixture_name.empty() && !test_name.empty()) {
    printf("Running specific test: %s::%s\n", fixture_name.c_str(), test_name.c_str());
  } else if (!fixture_name.empty()) {
    printf("Running fixture: %s\n", fixture_name.c_str());
  } else {
    printf("Running all tests\n");
  }

  srand(time(0));

  bool something_failed = false;
  int total_tests_run = 0;

  for (auto& tf : rtf_test_fixtures()) {
    if (!fixture_name.empty())
      if (tf->get_name() != fixture_name)
        continue;

    int tests_run = tf->run_tests(full_test_name);
    total_tests_run += tests_run;

    if (tf->something_failed()) {
      something_failed = true;
      tf->print_failures();
    }
  }

  if (total_tests_run > 0) {
    if (!something_failed)
      printf("\nSuccess.\n");
    else
      printf("\nFailure.\n");
  } else {
    printf("\nNo tests were run.\n");
    if (!fixture_name.empty() || !test_name.empty()) {
      printf("Error: Requested test not found.\n");
      return 1;
    }
  }

  // Nonzero so CTest sees the failure.
  return (something_failed) ? 1 : 0;
}
