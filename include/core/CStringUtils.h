/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_core_CStringUtils_h
#define INCLUDED_nrt_core_CStringUtils_h

#include <core/CNonInstantiatable.h>

#include <string>
#include <vector>

namespace nrt {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! A holder of string utility methods.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Conversions go through the C library strto* functions, which are the
//! only portable way to find out exactly how much of the input was used.
//! A conversion which doesn't consume the whole string fails.
//!
class CStringUtils : private CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;

    //! We should only have one definition of whitespace across the whole
    //! product - this definition matches ::isspace()
    static const std::string WHITESPACE_CHARS;

public:
    //! Convert a type to a string
    template<typename T>
    static std::string typeToString(const T& type) {
        return CStringUtils::_typeToString(type);
    }

    //! Convert a double to a string with the specified number of
    //! significant figures.
    static std::string typeToStringPrecise(double d, int significantFigures);

    //! Convert a string to a type
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type, and don't print an error message if the
    //! conversion fails
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Convert a string to lower case
    static std::string toLower(std::string str);

    //! Trim whitespace from the beginning and end of a string
    static void trimWhitespace(std::string& str);

    //! Trim the characters in \p toTrim from the beginning and end of a string
    static void trim(const std::string& toTrim, std::string& str);

private:
    static std::string _typeToString(const long long&);
    static std::string _typeToString(const long&);
    static std::string _typeToString(const int&);
    static std::string _typeToString(const std::size_t&);
    static std::string _typeToString(const bool&);
    static std::string _typeToString(const double&);
    static std::string _typeToString(const char*);
    static const std::string& _typeToString(const std::string& str);

    static bool _stringToType(bool silent, const std::string&, long long&);
    static bool _stringToType(bool silent, const std::string&, long&);
    static bool _stringToType(bool silent, const std::string&, int&);
    static bool _stringToType(bool silent, const std::string&, std::size_t&);
    //! Note that this is the only conversion to bool, because
    //! generic code should use 0/1 or true/false for booleans
    static bool _stringToType(bool silent, const std::string&, bool&);
    static bool _stringToType(bool silent, const std::string&, double&);
    static bool _stringToType(bool, const std::string&, std::string&);
};
}
}

#endif // INCLUDED_nrt_core_CStringUtils_h
