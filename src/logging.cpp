#include "logging.hpp"
#include <easylogging++.h>

void init_logging(bool verbose) {
    el::Loggers::addFlag(el::LoggingFlag::CreateLoggerAutomatically);
    
    el::Configurations conf;
    conf.setToDefault();
    if(!verbose) {
        // Disable detailed logging by default
        conf.set(el::Level::Info, el::ConfigurationType::Enabled, "false");
        conf.set(el::Level::Warning, el::ConfigurationType::Enabled, "false");
        conf.set(el::Level::Verbose, el::ConfigurationType::Enabled, "false");
        conf.set(el::Level::Debug, el::ConfigurationType::Enabled, "false");
        conf.set(el::Level::Trace, el::ConfigurationType::Enabled, "false");
    }
    el::Loggers::setDefaultConfigurations(conf, true);
}
