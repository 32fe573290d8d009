/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_settings.hpp>
#include <boost/log/utility/setup/settings_parser.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
using TProcessId = boost::log::attributes::current_process_id::value_type;

const std::string LEVEL_NAMES[]{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

//! Strip any directory from a source file path.
const char* baseName(const char* path) {
    const char* slash{std::strrchr(path, '/')};
    return slash == nullptr ? path : slash + 1;
}

//! Writes "time [pid] LEVEL file@line message".
void formatRecord(const boost::log::record_view& record,
                  boost::log::formatting_ostream& strm) {
    const nrt::core::CLogger& logger{nrt::core::CLogger::instance()};

    auto time = boost::log::extract<boost::posix_time::ptime>("TimeStamp", record);
    if (time) {
        strm << boost::posix_time::to_iso_extended_string(*time) << ' ';
    }
    auto pid = boost::log::extract<TProcessId>("ProcessID", record);
    if (pid) {
        strm << '[' << pid->native_id() << "] ";
    }
    auto level = boost::log::extract<nrt::core::CLogger::ELevel>("Severity", record);
    if (level) {
        strm << *level << ' ';
    }
    auto file = boost::log::extract<const char*>(logger.fileAttributeName(), record);
    auto line = boost::log::extract<int>(logger.lineAttributeName(), record);
    if (file) {
        strm << baseName(*file) << '@' << (line ? *line : 0) << ' ';
    }
    strm << record[boost::log::expressions::smessage];
}

// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.
const nrt::core::CLogger& DO_NOT_USE_THIS_VARIABLE = nrt::core::CLogger::instance();
}

namespace nrt {
namespace core {

CLogger::CLogger()
    : m_Reconfigured{false}, m_Level{E_Debug}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    // Allow settings files to filter and format on our severity levels.
    boost::log::register_simple_filter_factory<ELevel, char>("Severity");
    boost::log::register_simple_formatter_factory<ELevel, char>("Severity");
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    m_Reconfigured = false;
    m_FatalErrorHandler = defaultFatalErrorHandler;

    // When the logger first starts up, configure it to log to stderr at DEBUG
    // level.  Having this hardcoded configuration means that the unit tests
    // and other utility programs just work with minimal effort.
    try {
        this->addDefaultSink();
        this->setLoggingLevel(E_Debug);
    } catch (const std::exception& e) {
        // We can't use the log macros if the sink couldn't be created
        std::cerr << "Could not initialise logger: " << e.what() << std::endl;
    }
}

void CLogger::addDefaultSink() {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<TTextSink>(backend);
    sink->set_formatter(&formatRecord);
    core->add_sink(sink);
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("Nrt Fatal Exception");
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    LOG_FATAL(<< message);
    std::exit(EXIT_FAILURE);
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(
        boost::log::expressions::attr<ELevel>("Severity") >= level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    return LEVEL_NAMES[static_cast<int>(level)];
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to access properties file " << propertiesFile
                  << " for logger re-initialisation: " << ::strerror(errno));
        return false;
    }

    // Parse the settings prior to starting the reconfiguration so that a
    // malformed file leaves the current configuration untouched.
    boost::log::settings settings;
    try {
        settings = boost::log::parse_settings(strm);
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Unable to read from properties file " << propertiesFile
                  << " for logger re-initialisation: " << e.what());
        return false;
    }

    try {
        boost::log::core::get()->remove_all_sinks();
        boost::log::init_from_settings(settings);
    } catch (const std::exception& e) {
        this->addDefaultSink();
        LOG_ERROR(<< "Failed to reinitialise logger: " << e.what());
        return false;
    }

    m_Reconfigured = true;

    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);

    return true;
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name) {
        boost::algorithm::to_upper(name);
        for (int i = CLogger::E_Trace; i <= CLogger::E_Fatal; ++i) {
            if (name == LEVEL_NAMES[i]) {
                level = static_cast<CLogger::ELevel>(i);
                return strm;
            }
        }
        strm.setstate(std::ios::failbit);
    }
    return strm;
}
}
}
