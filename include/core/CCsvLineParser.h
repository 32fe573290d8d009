/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_core_CCsvLineParser_h
#define INCLUDED_nrt_core_CCsvLineParser_h

#include <string>
#include <vector>

namespace nrt {
namespace core {

//! \brief
//! Parses single lines of CSV formatted data.
//!
//! DESCRIPTION:\n
//! A class for parsing individual lines of CSV data.
//!
//! Fields containing the separator may be quoted and, as in Excel
//! style CSV, a quote within a quoted field is escaped by doubling it
//! up (i.e. "" means ").  Only fields that contain the separator need
//! to be quoted.
//!
//! IMPLEMENTATION DECISIONS:\n
//! boost::escaped_list_separator doesn't cope with doubled up quotes,
//! so this is a small bespoke state machine.
//!
class CCsvLineParser {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Default CSV separator
    static const char COMMA;

    //! CSV quote character
    static const char QUOTE;

public:
    //! Construct, optionally supplying a non-standard separator.
    //! The string to be parsed must be supplied by calling the
    //! reset() method.
    explicit CCsvLineParser(char separator = COMMA);

    //! Supply a new CSV string to be parsed.
    //!
    //! \note The line is not copied and must outlive the parsing.
    void reset(const std::string& line);

    //! Parse the next token from the current line.
    bool parseNext(std::string& value);

    //! Are we at the end of the current line?
    bool atEnd() const;

    //! Split the whole of \p line into \p fields.
    bool parseLine(const std::string& line, TStrVec& fields);

private:
    //! Input field separator by default this is ',' but can be
    //! overridden in the constructor.
    const char m_Separator;

    //! Did the separator character appear after the last CSV field
    //! we parsed?
    bool m_SeparatorAfterLastField;

    //! The line to be parsed.
    const std::string* m_Line;

    //! The current position in the line being parsed.
    std::string::size_type m_Pos;

    //! The field being built up.
    std::string m_WorkField;
};
}
}

#endif // INCLUDED_nrt_core_CCsvLineParser_h
