#include "test_env.hpp"
#include <cstdlib>
#include <string>

void set_test_env(const char* name, const char* value)
{
#if defined(_WIN32)
    std::string assignment = std::string(name) + "=" + (value ? value : "");
    _putenv(assignment.c_str());
#else
    if (!value || !*value) ::unsetenv(name);
    else ::setenv(name, value, 1);
#endif
}

ScopedTestEnv::ScopedTestEnv(const char* name, const char* value) : name_(name), had_(false)
{
    if (const char* old = std::getenv(name)) {
        had_ = true;
        saved_ = old;
    }
    set_test_env(name, value);
}

ScopedTestEnv::~ScopedTestEnv()
{
    set_test_env(name_, had_ ? saved_.c_str() : nullptr);
}
