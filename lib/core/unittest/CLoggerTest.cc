/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

BOOST_AUTO_TEST_SUITE(CLoggerTest)

namespace {
using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

class CTestFixture {
public:
    ~CTestFixture() {
        // Tests in this file can leave the logger in an unusual state, so reset it
        // after each test
        nrt::core::CLogger::instance().reset();
    }
};

//! Captures the messages of records that pass the core filter.
class CCapturingSink {
public:
    CCapturingSink()
        : m_Stream{boost::make_shared<std::ostringstream>()},
          m_Sink{boost::make_shared<TTextSink>()} {
        m_Sink->locked_backend()->add_stream(m_Stream);
        m_Sink->set_formatter(boost::log::expressions::stream
                              << boost::log::expressions::smessage);
        boost::log::core::get()->add_sink(m_Sink);
    }
    ~CCapturingSink() {
        boost::log::core::get()->remove_sink(m_Sink);
    }

    std::string contents() {
        m_Sink->flush();
        return m_Stream->str();
    }

private:
    boost::shared_ptr<std::ostringstream> m_Stream;
    boost::shared_ptr<TTextSink> m_Sink;
};
}

BOOST_FIXTURE_TEST_CASE(testLogging, CTestFixture) {
    std::string t("Test message");

    LOG_TRACE(<< "Trace");
    LOG_AT_LEVEL(nrt::core::CLogger::E_Trace, << "Dynamic TRACE " << 1);
    LOG_DEBUG(<< "Debug");
    LOG_AT_LEVEL(nrt::core::CLogger::E_Debug, << "Dynamic DEBUG " << 2.0);
    LOG_INFO(<< "Info " << std::boolalpha << true);
    LOG_AT_LEVEL(nrt::core::CLogger::E_Info, << "Dynamic INFO " << false);
    LOG_WARN(<< "Warn " << t);
    LOG_AT_LEVEL(nrt::core::CLogger::E_Warn, << "Dynamic WARN "
                                             << "abc");
    LOG_ERROR(<< "Error " << 1000 << ' ' << 0.23124F);
    LOG_AT_LEVEL(nrt::core::CLogger::E_Error, << "Dynamic ERROR");
    LOG_FATAL(<< "Fatal - application to handle exit");
    LOG_AT_LEVEL(nrt::core::CLogger::E_Fatal, << "Dynamic FATAL " << t);
    try {
        LOG_ABORT(<< "Throwing exception " << 1221U << ' ' << 0.23124);

        BOOST_TEST_REQUIRE(false);
    } catch (std::runtime_error&) { BOOST_TEST_REQUIRE(true); }
}

BOOST_FIXTURE_TEST_CASE(testDefaultLevelFiltersTrace, CTestFixture) {
    CCapturingSink sink;

    LOG_TRACE(<< "hidden trace");
    LOG_DEBUG(<< "visible debug");

    std::string logged{sink.contents()};
    BOOST_TEST_REQUIRE(logged.find("hidden trace") == std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("visible debug") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(testReconfiguration, CTestFixture) {
    nrt::core::CLogger& logger{nrt::core::CLogger::instance()};

    LOG_DEBUG(<< "Starting logger reconfiguration test");

    LOG_TRACE(<< "This shouldn't be seen because the hardcoded default log level is DEBUG");
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);

    BOOST_TEST_REQUIRE(logger.reconfigureFromFile("nonexistantfile") == false);
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured() == false);

    // The test boost.log.ini is very similar to the hardcoded default, but
    // with the level set to TRACE rather than DEBUG
    BOOST_TEST_REQUIRE(logger.reconfigureFromFile("testfiles/boost.log.ini"));
    BOOST_TEST_REQUIRE(logger.hasBeenReconfigured());

    CCapturingSink sink;
    LOG_TRACE(<< "This should be seen because the reconfigured log level is TRACE");
    BOOST_TEST_REQUIRE(sink.contents().find("reconfigured log level is TRACE") !=
                       std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(testSetLevel, CTestFixture) {
    nrt::core::CLogger& logger{nrt::core::CLogger::instance()};

    LOG_DEBUG(<< "Starting logger level test");

    CCapturingSink sink;

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(nrt::core::CLogger::E_Error));
    BOOST_REQUIRE_EQUAL(nrt::core::CLogger::E_Error, logger.loggingLevel());

    LOG_TRACE(<< "SHOULD NOT BE SEEN trace");
    LOG_DEBUG(<< "SHOULD NOT BE SEEN debug");
    LOG_INFO(<< "SHOULD NOT BE SEEN info");
    LOG_WARN(<< "SHOULD NOT BE SEEN warn");
    LOG_ERROR(<< "Should be seen error");
    LOG_FATAL(<< "Should be seen fatal");

    BOOST_TEST_REQUIRE(logger.setLoggingLevel(nrt::core::CLogger::E_Trace));

    LOG_TRACE(<< "Should be seen trace");

    std::string logged{sink.contents()};
    BOOST_TEST_REQUIRE(logged.find("SHOULD NOT BE SEEN") == std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Should be seen error") != std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Should be seen fatal") != std::string::npos);
    BOOST_TEST_REQUIRE(logged.find("Should be seen trace") != std::string::npos);

    LOG_DEBUG(<< "Finished logger level test");
}

BOOST_FIXTURE_TEST_CASE(testLevelNames, CTestFixture) {
    BOOST_REQUIRE_EQUAL(std::string{"TRACE"},
                        nrt::core::CLogger::levelToString(nrt::core::CLogger::E_Trace));
    BOOST_REQUIRE_EQUAL(std::string{"FATAL"},
                        nrt::core::CLogger::levelToString(nrt::core::CLogger::E_Fatal));

    nrt::core::CLogger::ELevel level{nrt::core::CLogger::E_Debug};
    std::istringstream warn{"warn"};
    BOOST_TEST_REQUIRE(static_cast<bool>(warn >> level));
    BOOST_REQUIRE_EQUAL(nrt::core::CLogger::E_Warn, level);

    std::istringstream bad{"loud"};
    BOOST_TEST_REQUIRE(static_cast<bool>(bad >> level) == false);
    BOOST_REQUIRE_EQUAL(nrt::core::CLogger::E_Warn, level);

    std::ostringstream out;
    out << nrt::core::CLogger::E_Info;
    BOOST_REQUIRE_EQUAL(std::string{"INFO"}, out.str());
}

BOOST_FIXTURE_TEST_CASE(testDefaultFormat, CTestFixture) {
    std::ostringstream captured;
    std::streambuf* clogBuf{std::clog.rdbuf(captured.rdbuf())};
    LOG_INFO(<< "Formatted message");
    std::clog.rdbuf(clogBuf);

    std::string line{captured.str()};
    LOG_DEBUG(<< "Default sink wrote: " << line);

    // The process ID is the native decimal one.
    std::ostringstream expected;
    expected << " [" << ::getpid() << "] INFO CLoggerTest.cc@";
    BOOST_TEST_REQUIRE(line.find(expected.str()) != std::string::npos);
    BOOST_TEST_REQUIRE(line.find("0x") == std::string::npos);
    BOOST_TEST_REQUIRE(line.find("Formatted message") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(testFatalErrorHandler, CTestFixture) {
    std::string handled;
    {
        nrt::core::CLogger::CScopeSetFatalErrorHandler scope{
            [&handled](std::string message) { handled = std::move(message); }};
        HANDLE_FATAL(<< "Fatal error " << 42)
    }
    BOOST_REQUIRE_EQUAL(std::string{"Fatal error 42"}, handled);
}

BOOST_AUTO_TEST_SUITE_END()
