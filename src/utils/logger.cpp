#include <utils/logger.hpp>
#include <iostream>
#include <mutex>

namespace SixDegrees {

bool& Logger::quiet() {
    static bool flag = false;
    return flag;
}

void Logger::log(Level level, const std::string& message) {
    if (quiet() && level != Level::Warning && level != Level::Error) return;

    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    const char* color = "";
    const char* prefix = "";
    std::ostream* out = &std::cout;

    switch (level) {
        case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break;
        case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break;
        case Level::Success: color = "\033[0;32m"; prefix = "[ok] "; break;
        case Level::Warning: color = "\033[1;33m"; prefix = "[warn] "; out = &std::cerr; break;
        case Level::Error:   color = "\033[0;31m"; prefix = "[error] "; out = &std::cerr; break;
        case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break;
    }

    *out << color << prefix << message << "\033[0m" << std::endl;
}

} // namespace SixDegrees
