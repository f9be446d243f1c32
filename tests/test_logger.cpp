#include "utils/Logger.hpp"
#include <cassert>
#include <sstream>
#include <string>

int main() {
    assert(st::parseLogLevel("debug") == st::LogLevel::Debug);
    assert(st::parseLogLevel("Warning") == st::LogLevel::Warn);
    assert(st::parseLogLevel("ERROR") == st::LogLevel::Error);
    assert(st::parseLogLevel("verbose") == st::LogLevel::Info);
    assert(st::parseLogLevel("", st::LogLevel::Error) == st::LogLevel::Error);

    std::ostringstream out;
    st::setLogSink(&out);
    st::setLogLevel(st::LogLevel::Warn);
    ST_LOG(st::LogLevel::Info, "hidden");
    assert(out.str().empty());

    ST_LOG(st::LogLevel::Warn, "cache full");
    const std::string line = out.str();
    assert(line.rfind("[WARN] ", 0) == 0);
    assert(line.find(" test_logger.cpp:") != std::string::npos);
    assert(line.find("/test_logger.cpp") == std::string::npos);
    assert(line.find(" cache full\n") != std::string::npos);
    // "[WARN] YYYY-MM-DD HH:MM:SS.mmm "
    assert(line.size() > 31 && line[26] == '.' && line[30] == ' ');

    out.str("");
    st::setLogLevel(st::LogLevel::Debug);
    assert(st::logEnabled(st::LogLevel::Debug));
    st::log(st::LogLevel::Error, "no location");
    assert(out.str().find("[ERROR]") == 0);
    assert(out.str().find(" no location\n") != std::string::npos);

    st::setLogSink(nullptr);
    return 0;
}
