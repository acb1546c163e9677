#include "combinators.hpp"

#include <climits>
#include <stdexcept>
#include <vector>

namespace recog {

static ResultPtr element(size_t i, const ResultPtr &r) {
    return as_list(r).at(i);
}

Parser p_lit(const std::string &s) {
    std::vector<Parser> chars;
    for (char c : s) {
        chars.push_back(p_lit(c));
    }
    return p_join(p_seq(chars));
}

Parser p_maybe(const Parser &parser) {
    return p_or(parser, p_empty());
}

Parser p_oneplus(const Parser &parser) {
    Parser seq = p_apply(p_and(parser, p_zeroplus(parser)), [](const ResultPtr &r) {
        return cons(element(0, r), element(1, r));
    });
    return [seq](const Text &text, const Cursor &cursor) -> Match {
        Match m = seq(text, cursor);
        if (!m) { return Match::failure(FailureKind::NoMatch); }
        return m;
    };
}

Parser p_sepby1(const Parser &parser, const Parser &sep) {
    Parser rest = p_zeroplus(p_apply(p_and(sep, parser), [](const ResultPtr &r) {
        return element(1, r);
    }));
    return p_apply(p_and(parser, rest), [](const ResultPtr &r) {
        return cons(element(0, r), element(1, r));
    });
}

static std::string unique(const std::string &s) {
    std::string unique_s;
    for (char c : s) {
        if (unique_s.find(c) == std::string::npos) {
            unique_s += c;
        }
    }
    return unique_s;
}

Parser p_choose(const std::string &chars) {
    std::vector<Parser> alternatives;
    for (char c : unique(chars)) {
        alternatives.push_back(p_lit(c));
    }
    return p_alt(alternatives);
}

Parser p_join(const Parser &parser) {
    return p_apply(parser, [](const ResultPtr &r) {
        return make_string(concat(r));
    });
}

Parser p_chomp(const Parser &parser) {
    return p_apply(parser, [](const ResultPtr &) {
        return empty_result();
    });
}

Parser p_between(const Parser &open, const Parser &parser, const Parser &close) {
    return p_apply(p_and(open, parser, close), [](const ResultPtr &r) {
        return element(1, r);
    });
}

Parser p_atleast(const Parser &parser, size_t n) {
    Parser many = p_zeroplus(parser);
    return [many, n](const Text &text, const Cursor &cursor) -> Match {
        Match m = many(text, cursor);
        if (as_list(m.value()).size() < n) {
            return Match::failure(FailureKind::NoMatch);
        }
        return m;
    };
}

Parser p_exactly(const Parser &parser, size_t n) {
    return p_seq(std::vector<Parser>(n, parser));
}

Parser p_group(const Parser &parser) {
    return p_apply(parser, [](const ResultPtr &r) {
        return make_list(std::vector<ResultPtr>(1, r));
    });
}

Parser p_trace(const std::string &name, const Parser &parser, std::ostream &log) {
    if (!parser) {
        throw std::invalid_argument("p_trace: empty parser");
    }
    std::ostream *out = &log;
    return [name, parser, out](const Text &text, const Cursor &cursor) -> Match {
        *out << name << ": try " << cursor << std::endl;
        Match m = parser(text, cursor);
        if (m) {
            *out << name << ": match " << cursor << ".." << m.cursor() << " " << *m.value() << std::endl;
        }
        else {
            *out << name << ": fail " << cursor << " " << m.kind() << std::endl;
        }
        return m;
    };
}

Parser p_whitespace() {
    return p_choose(" \t\r\n");
}

Parser p_digit() {
    return p_range('0', '9');
}

Parser p_hexdigit() {
    return p_or(p_digit(), p_range('a', 'f'), p_range('A', 'F'));
}

Parser p_lower() {
    return p_range('a', 'z');
}

Parser p_upper() {
    return p_range('A', 'Z');
}

Parser p_alpha() {
    return p_or(p_lower(), p_upper());
}

Parser p_alphanum() {
    return p_or(p_alpha(), p_digit());
}

Parser p_spaces() {
    return p_join(p_oneplus(p_whitespace()));
}

Parser p_digits() {
    return p_join(p_oneplus(p_digit()));
}

Parser p_hexdigits() {
    return p_join(p_oneplus(p_hexdigit()));
}

Parser p_letters() {
    return p_join(p_oneplus(p_alpha()));
}

static bool negative_sign(const ResultPtr &sign) {
    return !sign->is_empty() && value_of<char>(sign) == '-';
}

/* The magnitude may reach LLONG_MAX, or one past it when negative. */
static bool to_int(const std::string &digits, bool negative, int base, long long &n) {
    unsigned long long magnitude;
    try {
        magnitude = std::stoull(digits, NULL, base);
    }
    catch (const std::out_of_range &) {
        return false;
    }
    unsigned long long limit = (unsigned long long)LLONG_MAX;
    if (negative) {
        if (magnitude > limit + 1) { return false; }
        n = magnitude == limit + 1 ? LLONG_MIN : -(long long)magnitude;
    }
    else {
        if (magnitude > limit) { return false; }
        n = (long long)magnitude;
    }
    return true;
}

/* parser yields a list with the optional sign first and the digit string
   at digits_at. A value that does not fit is a NoMatch. */
static Parser p_number(const Parser &parser, size_t digits_at, int base) {
    return [parser, digits_at, base](const Text &text, const Cursor &cursor) -> Match {
        Match m = parser(text, cursor);
        if (!m) { return m; }
        long long n;
        std::string digits = value_of<std::string>(element(digits_at, m.value()));
        if (!to_int(digits, negative_sign(element(0, m.value())), base, n)) {
            return Match::failure(FailureKind::NoMatch);
        }
        return Match::success(make_int(n), m.cursor());
    };
}

Parser p_int() {
    return p_number(p_and(p_maybe(p_choose("+-")), p_digits()), 1, 10);
}

Parser p_hexint() {
    Parser parser = p_and(p_maybe(p_choose("+-")),
                          p_lit('0'),
                          p_choose("xX"),
                          p_hexdigits());
    return p_number(parser, 3, 16);
}

}
