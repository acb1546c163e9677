#ifndef RECOG_COMBINATORS_HPP
#define RECOG_COMBINATORS_HPP

#include <iostream>
#include <string>

#include "parser.hpp"

namespace recog {

/* Useful constructions of the primitive combinators. */

/* Parses the string s, producing it as one StringResult. */
Parser p_lit(const std::string &s);

/* Zero or one p. Produces p's value or the empty value. */
Parser p_maybe(const Parser &parser);

/* One or more p. A failure of the first attempt is reported as NoMatch
   whatever its kind. */
Parser p_oneplus(const Parser &parser);

/* p (sep p)*, keeping only the values of p. */
Parser p_sepby1(const Parser &parser, const Parser &sep);

/* Any one of chars, tried in order. */
Parser p_choose(const std::string &chars);

/* Collapses a list of chars and strings into one StringResult. */
Parser p_join(const Parser &parser);

Parser p_chomp(const Parser &parser);
Parser p_between(const Parser &open, const Parser &parser, const Parser &close);
Parser p_atleast(const Parser &parser, size_t n);
Parser p_exactly(const Parser &parser, size_t n);
Parser p_group(const Parser &parser);

/* Logs every attempt of parser to log, one line per event. The parser
   keeps a pointer to log, so log must outlive it and every copy of it. */
Parser p_trace(const std::string &name, const Parser &parser, std::ostream &log = std::cerr);

/* Pre-built sets. */

Parser p_whitespace();
Parser p_digit();
Parser p_hexdigit();
Parser p_lower();
Parser p_upper();
Parser p_alpha();
Parser p_alphanum();

Parser p_spaces();
Parser p_digits();
Parser p_hexdigits();
Parser p_letters();

/* [+-]?[0-9]+ as an IntResult. A value that does not fit in long long
   is a NoMatch. */
Parser p_int();

/* [+-]?0[xX][0-9a-fA-F]+ as an IntResult. Same range rule as p_int. */
Parser p_hexint();

}

#endif
