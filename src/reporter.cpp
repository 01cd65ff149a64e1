#include "addonsync/reporter.hpp"

#include <iostream>

namespace addonsync {

StreamReporter::StreamReporter() : StreamReporter(std::cerr, std::cout) {}

StreamReporter::StreamReporter(std::ostream &warn_os, std::ostream &info_os)
    : warn_os_(&warn_os), info_os_(&info_os) {}

void StreamReporter::warn(std::string_view message) {
  *warn_os_ << "warning: " << message << "\n";
}

void StreamReporter::info(std::string_view message) { *info_os_ << message << "\n"; }

} // namespace addonsync
