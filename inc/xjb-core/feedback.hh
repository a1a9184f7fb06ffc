#pragma once

#include <string>

namespace xjb {

    // each message is printed with a prefix; continuation lines are indented
    // to the prefix width.
    void error(std::string msg);
    void warning(std::string msg);
    void info(std::string msg);
    void more(std::string msg);

}   // namespace xjb
