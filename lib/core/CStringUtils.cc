/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace nrt {
namespace core {

namespace {
//! Check that strto* consumed the whole of \p str.
bool consumedAll(const std::string& str, const char* endPtr, bool silent, const char* typeName) {
    if (endPtr != nullptr && *endPtr != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << typeName
                      << ": first invalid character " << endPtr);
        }
        return false;
    }
    return true;
}
}

// Initialise statics
const std::string CStringUtils::WHITESPACE_CHARS{" \t\r\n\v\f"};

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return str;
}

void CStringUtils::trimWhitespace(std::string& str) {
    CStringUtils::trim(WHITESPACE_CHARS, str);
}

void CStringUtils::trim(const std::string& toTrim, std::string& str) {
    if (toTrim.empty() || str.empty()) {
        return;
    }

    std::string::size_type pos = str.find_last_not_of(toTrim);
    if (pos == std::string::npos) {
        // Special case - entire string is being trimmed
        str.clear();
        return;
    }

    str.erase(pos + 1);

    pos = str.find_first_not_of(toTrim);
    if (pos != std::string::npos && pos > 0) {
        str.erase(0, pos);
    }
}

std::string CStringUtils::_typeToString(const long long& i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld", i);
    return buf;
}

std::string CStringUtils::_typeToString(const long& i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%ld", i);
    return buf;
}

std::string CStringUtils::_typeToString(const int& i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%d", i);
    return buf;
}

std::string CStringUtils::_typeToString(const std::size_t& i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%zu", i);
    return buf;
}

std::string CStringUtils::_typeToString(const bool& b) {
    return b ? "true" : "false";
}

std::string CStringUtils::_typeToString(const double& d) {
    // Note the extra large buffer here, which is because the format string is
    // "%f" rather than "%g", which means we could be printing a 308 digit
    // number without resorting to scientific notation
    char buf[64 * sizeof(double)];
    std::snprintf(buf, sizeof(buf), "%f", d);
    return buf;
}

std::string CStringUtils::_typeToString(const char* str) {
    return str;
}

// This may seem silly, but it allows generic code to be written
const std::string& CStringUtils::_typeToString(const std::string& str) {
    return str;
}

std::string CStringUtils::typeToStringPrecise(double d, int significantFigures) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", significantFigures, d);
    return buf;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long long& i) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to long long");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    long long ret{std::strtoll(str.c_str(), &endPtr, 10)};

    if ((ret == LLONG_MIN || ret == LLONG_MAX) && errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to long long: " << ::strerror(errno));
        }
        return false;
    }
    if (consumedAll(str, endPtr, silent, "long long") == false) {
        return false;
    }

    i = ret;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& i) {
    long long ret{0};
    if (_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret < LONG_MIN || ret > LONG_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to long - out of range");
        }
        return false;
    }
    i = static_cast<long>(ret);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& i) {
    long long ret{0};
    if (_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret < INT_MIN || ret > INT_MAX) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int - out of range");
        }
        return false;
    }
    i = static_cast<int>(ret);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, std::size_t& i) {
    long long ret{0};
    if (_stringToType(silent, str, ret) == false) {
        return false;
    }
    if (ret < 0) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to size_t - negative");
        }
        return false;
    }
    i = static_cast<std::size_t>(ret);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{toLower(str)};
    if (lower == "true" || lower == "yes" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        ret = false;
        return true;
    }
    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& d) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to double");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    double ret{std::strtod(str.c_str(), &endPtr)};

    if ((ret == HUGE_VAL || ret == -HUGE_VAL) && errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to double: " << ::strerror(errno));
        }
        return false;
    }
    if (consumedAll(str, endPtr, silent, "double") == false) {
        return false;
    }

    d = ret;
    return true;
}

bool CStringUtils::_stringToType(bool, const std::string& str, std::string& ret) {
    ret = str;
    return true;
}
}
}
