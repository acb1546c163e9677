#ifndef RECOG_PARSER_HPP
#define RECOG_PARSER_HPP

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "result.hpp"
#include "text.hpp"

namespace recog {

/* The outcome of one recognition attempt: a value and the cursor after it,
   or the reason for giving up. */
class Match {
public:
    static Match success(const ResultPtr &value, const Cursor &next) {
        return Match(true, FailureKind::NoMatch, value, next);
    }

    static Match failure(FailureKind kind) {
        return Match(false, kind, ResultPtr(), Cursor());
    }

    explicit operator bool() const {
        return matched;
    }

    bool succeeded() const {
        return matched;
    }

    FailureKind kind() const {
        return failure_kind;
    }

    const ResultPtr &value() const {
        return result;
    }

    const Cursor &cursor() const {
        return next;
    }

    friend std::ostream &operator<<(std::ostream &output, const Match &match);

private:
    Match(bool matched, FailureKind kind, const ResultPtr &result, const Cursor &next)
        : matched(matched), failure_kind(kind), result(result), next(next) {}

    bool matched;
    FailureKind failure_kind;
    ResultPtr result;
    Cursor next;
};

/* Every recognizer and combinator has this shape. A Parser never changes
   after construction, so one graph can serve any number of parses. */
typedef std::function<Match(const Text &, const Cursor &)> Parser;

typedef std::function<bool(char)> CharPredicate;
typedef std::function<ResultPtr(const ResultPtr &)> ApplyFunc;

Match recognize(const Parser &parser, const Text &text, const Cursor &cursor);

/* Runs parser from the start of text and returns its value. Throws
   EndOfTextError or NoMatchError when it fails. */
ResultPtr parse(const Text &text, const Parser &parser);
ResultPtr parse(const std::string &s, const Parser &parser);

/* Fundamental parsers. */

Parser p_lit(char c);
Parser p_satisfy(const CharPredicate &pred);
Parser p_range(char min, char max);
Parser p_any();
Parser p_end();
Parser p_empty();

/* Primitive combinators. */

Parser p_seq(const std::vector<Parser> &parsers);
Parser p_alt(const std::vector<Parser> &parsers);
Parser p_zeroplus(const Parser &parser);
Parser p_apply(const Parser &parser, const ApplyFunc &f);

namespace detail {

inline void collect(std::vector<Parser> &out) {
    (void)out;
}

template<typename U, typename... T>
void collect(std::vector<Parser> &out, const U &head, const T &... tail) {
    out.push_back(head);
    collect(out, tail...);
}

}

template<typename... T>
Parser p_and(const T &... parsers) {
    std::vector<Parser> ps;
    detail::collect(ps, parsers...);
    return p_seq(ps);
}

template<typename... T>
Parser p_or(const T &... parsers) {
    std::vector<Parser> ps;
    detail::collect(ps, parsers...);
    return p_alt(ps);
}

}

#endif
