#include "parser.hpp"

#include <stdexcept>

namespace recog {

std::ostream &operator<<(std::ostream &output, const Match &match) {
    if (match) {
        output << *match.value() << " " << match.cursor();
    }
    else {
        output << "<" << match.kind() << ">";
    }
    return output;
}

Match recognize(const Parser &parser, const Text &text, const Cursor &cursor) {
    return parser(text, cursor);
}

ResultPtr parse(const Text &text, const Parser &parser) {
    Match m = recognize(parser, text, text.start_cursor());
    if (!m) {
        throw_failure(m.kind());
    }
    return m.value();
}

ResultPtr parse(const std::string &s, const Parser &parser) {
    return parse(StringText(s), parser);
}

static void check_parser(const Parser &parser, const char *who) {
    if (!parser) {
        throw std::invalid_argument(std::string(who) + ": empty parser");
    }
}

static void check_parsers(const std::vector<Parser> &parsers, const char *who) {
    for (const auto &p : parsers) {
        check_parser(p, who);
    }
}

/* Parser functions. */

Parser p_satisfy(const CharPredicate &pred) {
    if (!pred) {
        throw std::invalid_argument("p_satisfy: empty predicate");
    }
    return [pred](const Text &text, const Cursor &cursor) -> Match {
        char c;
        Cursor next;
        if (!text.read(cursor, c, next)) {
            return Match::failure(FailureKind::EndOfText);
        }
        if (!pred(c)) {
            return Match::failure(FailureKind::NoMatch);
        }
        return Match::success(make_char(c), next);
    };
}

Parser p_lit(char c) {
    return p_satisfy([c](char ch) { return ch == c; });
}

Parser p_range(char min, char max) {
    if (min > max) {
        throw std::invalid_argument("p_range: min is greater than max");
    }
    return p_satisfy([min, max](char ch) { return min <= ch && ch <= max; });
}

Parser p_any() {
    return p_satisfy([](char) { return true; });
}

/* Succeeds only where the text is exhausted. */
Parser p_end() {
    return [](const Text &text, const Cursor &cursor) -> Match {
        char c;
        Cursor next;
        if (text.read(cursor, c, next)) {
            return Match::failure(FailureKind::NoMatch);
        }
        return Match::success(empty_result(), cursor);
    };
}

Parser p_empty() {
    return [](const Text &text, const Cursor &cursor) -> Match {
        (void)text;
        return Match::success(empty_result(), cursor);
    };
}

Parser p_seq(const std::vector<Parser> &parsers) {
    check_parsers(parsers, "p_seq");
    return [parsers](const Text &text, const Cursor &cursor) -> Match {
        std::vector<ResultPtr> results;
        results.reserve(parsers.size());
        Cursor cur = cursor;
        for (const auto &p : parsers) {
            Match m = p(text, cur);
            if (!m) { return m; }
            results.push_back(m.value());
            cur = m.cursor();
        }
        return Match::success(make_list(results), cur);
    };
}

/* Every branch starts from the same cursor. Either failure kind moves on
   to the next branch; running out of branches is a NoMatch. */
Parser p_alt(const std::vector<Parser> &parsers) {
    check_parsers(parsers, "p_alt");
    return [parsers](const Text &text, const Cursor &cursor) -> Match {
        for (const auto &p : parsers) {
            Match m = p(text, cursor);
            if (m) { return m; }
        }
        return Match::failure(FailureKind::NoMatch);
    };
}

/* Never fails. parser must consume input on success or this never ends. */
Parser p_zeroplus(const Parser &parser) {
    check_parser(parser, "p_zeroplus");
    return [parser](const Text &text, const Cursor &cursor) -> Match {
        std::vector<ResultPtr> results;
        Cursor cur = cursor;
        Match m = parser(text, cur);
        while (m) {
            results.push_back(m.value());
            cur = m.cursor();
            m = parser(text, cur);
        }
        return Match::success(make_list(results), cur);
    };
}

Parser p_apply(const Parser &parser, const ApplyFunc &f) {
    check_parser(parser, "p_apply");
    if (!f) {
        throw std::invalid_argument("p_apply: empty function");
    }
    return [parser, f](const Text &text, const Cursor &cursor) -> Match {
        Match m = parser(text, cursor);
        if (!m) { return m; }
        return Match::success(f(m.value()), m.cursor());
    };
}

}
