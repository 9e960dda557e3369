#include <strata/reporter.hpp>
#include <strata/log.hpp>

namespace strata {

void LogReporter::on_step_start(const std::string& message) {
    log::info("%s", message.c_str());
}

void LogReporter::on_step_finish(const std::string& message) {
    log::debug("finished %s", message.c_str());
}

void LogReporter::on_operation(const std::string& kind, const std::string& package) {
    log::debug("%s %s", kind.c_str(), package.c_str());
}

} // namespace strata
