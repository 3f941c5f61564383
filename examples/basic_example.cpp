// Parse an embedded document, look up a few values and print it back.
#include <iostream>
#include <string>
#include "ini/ini.hpp"

using namespace ini;

int main(){
    const char* src = R"INI(
; model run options
[OpenM]
Database = "Database=model.sqlite; Timeout=86400; OpenMode=ReadWrite;"
LogToConsole = true   # also log to stdout

[Parameter]
Labels = Aname, \
         Bname, \
         Cname
Title  = "Default scenario \
  with comments ; kept"
)INI";

    mapping values;
    try {
        values = parse(src);
    } catch(const parse_error& e){
        std::cerr << error_code_name(e.code()) << ": " << e.what() << "\n";
        return 1;
    }

    std::cout << "OpenM.Database = " << values["OpenM.Database"] << "\n";
    std::cout << "Parameter.Labels = " << values["Parameter.Labels"] << "\n";
    std::cout << "Parameter.Title = " << values["Parameter.Title"] << "\n";
    std::cout << "\n" << to_string(values);
    return 0;
}
