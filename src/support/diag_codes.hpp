//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_codes.hpp
// Purpose: Centralized diagnostic codes for the template compiler and the
//          execution harness.
// Key invariants: All codes are unique and follow T#### format; the thousands
//                 digit selects the error kind.
// Ownership/Lifetime: Static constants with program lifetime
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace reltpl::diag
{

/// Lexer error codes (T1000-T1999)
constexpr std::string_view UnterminatedDirective = "T1001";
constexpr std::string_view UnterminatedSubstitution = "T1002";
constexpr std::string_view UnterminatedComment = "T1003";
constexpr std::string_view UnknownSection = "T1004";

/// Parser error codes (T2000-T2999)
constexpr std::string_view UnexpectedClose = "T2001";
constexpr std::string_view MismatchedClose = "T2002";
constexpr std::string_view UnclosedConstruct = "T2003";
constexpr std::string_view MacroNotTopLevel = "T2004";
constexpr std::string_view WriteNotTopLevel = "T2005";
constexpr std::string_view UnknownDirective = "T2006";
constexpr std::string_view MalformedClause = "T2007";
constexpr std::string_view InvalidSeparator = "T2008";
constexpr std::string_view InvalidSubstitution = "T2009";

/// Macro resolution error codes (T3000-T3999)
constexpr std::string_view UnknownMacro = "T3001";
constexpr std::string_view MacroRedefined = "T3002";
constexpr std::string_view RecursiveMacro = "T3003";
constexpr std::string_view ArgumentCountMismatch = "T3004";
constexpr std::string_view UnknownParameter = "T3005";
constexpr std::string_view DuplicateParameter = "T3006";

/// Query generation error codes (T4000-T4999)
constexpr std::string_view NestingTooDeep = "T4001";
constexpr std::string_view AliasCollision = "T4002";
constexpr std::string_view UnknownTable = "T4003";
constexpr std::string_view UnknownOrderColumn = "T4004";
constexpr std::string_view FieldOutsideLoop = "T4005";
constexpr std::string_view UnknownRowSource = "T4006";
constexpr std::string_view UnsupportedLiteral = "T4007";
constexpr std::string_view UnknownColumn = "T4008";

/// Execution error codes (T5000-T5999)
constexpr std::string_view InitFailed = "T5001";
constexpr std::string_view BodyFailed = "T5002";
constexpr std::string_view FiniFailed = "T5003";
constexpr std::string_view ContextSetupFailed = "T5004";
constexpr std::string_view InvalidOutputPath = "T5005";
constexpr std::string_view OutputWriteFailed = "T5006";

/// @brief Broad category of a failure, derived from its code.
enum class ErrorKind
{
    Lex,
    Parse,
    Resolution,
    Generation,
    Execution,
    Unknown
};

/// @brief Classify a diagnostic code by its thousands digit.
constexpr ErrorKind errorKindOf(std::string_view code)
{
    if (code.size() != 5 || code[0] != 'T')
        return ErrorKind::Unknown;
    switch (code[1])
    {
        case '1':
            return ErrorKind::Lex;
        case '2':
            return ErrorKind::Parse;
        case '3':
            return ErrorKind::Resolution;
        case '4':
            return ErrorKind::Generation;
        case '5':
            return ErrorKind::Execution;
        default:
            return ErrorKind::Unknown;
    }
}

} // namespace reltpl::diag
