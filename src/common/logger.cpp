#include "common/logger.hpp"

// plog
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/FuncMessageFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Logger.h>

#include <iostream>
#include <memory>
#include <mutex>

namespace quickfilter {
namespace logging {

struct LogAppender : public plog::IAppender {
    LoggingCallback callback;

    void write(const plog::Record &record) override {
        const auto severity = record.getSeverity();
        auto formatted = plog::FuncMessageFormatter::format(record);
        formatted.pop_back(); // remove newline

        std::string str = formatted;
        if (!callback(static_cast<Level>(severity), str)) {
            std::cout << plog::severityToString(severity) << " " << str << std::endl;
        }
    }
};

void InitLogger(Level level, LoggingCallback callback) {
    static std::unique_ptr<LogAppender> appender;
    const auto severity = static_cast<plog::Severity>(level);
    if (appender) {
        appender->callback = std::move(callback);
        InitLogger(severity, nullptr); // change the severity
    } else if (callback) {
        appender = std::make_unique<LogAppender>();
        appender->callback = std::move(callback);
        InitLogger(severity, appender.get());
    } else {
        InitLogger(severity, nullptr); // log to cout
    }
}

void InitLogger(plog::Severity severity, plog::IAppender *appender) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    static plog::Logger<0> *logger = nullptr;
    static std::mutex mutex;
    std::lock_guard lock(mutex);
    if (!logger) {
        logger = &plog::init(severity, appender ? appender : &console_appender);
        PLOG_DEBUG << "Logger initialized";
    } else {
        logger->setMaxSeverity(severity);
        if (appender) {
            logger->addAppender(appender);
        }
    }
}

} // namespace logging
} // namespace quickfilter
