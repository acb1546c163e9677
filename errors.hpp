#ifndef RECOG_ERRORS_HPP
#define RECOG_ERRORS_HPP

#include <iostream>
#include <stdexcept>
#include <string>

namespace recog {

/* Why a recognizer gave up. EndOfText means the source ran out at the
   attempted read; NoMatch means an element was there but was rejected. */
enum class FailureKind {
    EndOfText,
    NoMatch
};

const char *failure_name(FailureKind kind);

std::ostream &operator<<(std::ostream &output, FailureKind kind);

/* Thrown by parse() only. The engine itself reports failures as values. */
class ParseError : public std::runtime_error {
public:
    ParseError(FailureKind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}

    FailureKind kind() const {
        return kind_;
    }

private:
    FailureKind kind_;
};

class EndOfTextError : public ParseError {
public:
    EndOfTextError() : ParseError(FailureKind::EndOfText, "unexpected end of text") {}
};

class NoMatchError : public ParseError {
public:
    NoMatchError() : ParseError(FailureKind::NoMatch, "input did not match") {}
};

void throw_failure(FailureKind kind);

/* The source itself broke (an I/O error). This is not a parse outcome and
   passes straight through every combinator. */
class TextError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}

#endif
