#ifndef RECOG_CLI_HPP
#define RECOG_CLI_HPP

#include <iostream>
#include <map>
#include <string>

#include "combinators.hpp"

namespace recog {

/* p, then trailing whitespace, then the end of the input. */
Parser p_whole(const Parser &parser);

/* The grammars the recog tool can run, by name. */
std::map<std::string, Parser> grammars();

/* recog [--grammar NAME] [--trace] [--list] [FILE]
   Reads FILE, or stdin without one. Results go to out, usage errors and
   traces to err. Returns 0 on a match, 1 on a parse failure and 2 on a
   usage or I/O error. */
int run_cli(int argc, const char *const *argv, std::ostream &out, std::ostream &err);

}

#endif
