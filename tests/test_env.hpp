#pragma once
#include <string>

// Test-only cross-platform environment helpers used by the INI_* env flag tests.
// An empty value unsets the variable.

void set_test_env(const char* name, const char* value);

// Restores the previous value of an env var when it goes out of scope.
struct ScopedTestEnv {
    ScopedTestEnv(const char* name, const char* value);
    ~ScopedTestEnv();
    ScopedTestEnv(const ScopedTestEnv&) = delete;
    ScopedTestEnv& operator=(const ScopedTestEnv&) = delete;
private:
    const char* name_;
    bool had_;
    std::string saved_;
};
