#include <iostream>
#include <exception>
#include "ini/ini.hpp"
// GoogleTest cases compiled into this binary (fixture + properties) are dispatched explicitly
// after the assert-based suites; we link GTest::gtest, not gtest_main.
#include <gtest/gtest.h>

void run_line_reader_tests();
void run_scanner_tests();
void run_parser_tests();
void run_continuation_tests();
void run_error_tests();
void run_writer_tests();
void run_diagnostics_json_tests();
void run_file_tests();

int main(int argc, char** argv){
    // Smoke: the documented scenarios through the public entry point
    auto m = ini::parse("[a]\nk = hello world ; note\n");
    if(m.at("a.k") != "hello world"){ std::cerr << "[smoke] unexpected value\n"; return 1; }

    try{
        run_line_reader_tests();
        run_scanner_tests();
        run_parser_tests();
        run_continuation_tests();
        run_error_tests();
        run_writer_tests();
        run_diagnostics_json_tests();
        run_file_tests();
    }catch(const std::exception& e){ std::cerr << "[tests] exception: " << e.what() << "\n"; return 1; }
    std::cout << "All assert suites passed" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
