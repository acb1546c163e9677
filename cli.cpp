#include "cli.hpp"

#include <cerrno>
#include <memory>
#include <stdexcept>

#include <stdio.h>
#include <string.h>

namespace recog {

Parser p_whole(const Parser &parser) {
    return p_apply(p_and(parser, p_chomp(p_zeroplus(p_whitespace())), p_end()),
                   [](const ResultPtr &r) { return as_list(r).at(0); });
}

std::map<std::string, Parser> grammars() {
    std::map<std::string, Parser> g;
    g["ints"] = p_whole(p_sepby1(p_int(), p_lit(',')));
    g["hex"] = p_whole(p_hexint());
    g["words"] = p_whole(p_sepby1(p_letters(), p_spaces()));
    g["parens"] = p_exactly(p_between(p_lit('('), p_lower(), p_lit(')')), 2);
    g["keyword"] = p_lit("hello");
    return g;
}

static void usage(std::ostream &out) {
    out << "usage: recog [--grammar NAME] [--trace] [--list] [FILE]" << std::endl;
}

int run_cli(int argc, const char *const *argv, std::ostream &out, std::ostream &err) {
    std::map<std::string, Parser> g = grammars();
    std::string grammar = "ints";
    bool trace = false;
    const char *path = NULL;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--grammar") == 0 && i + 1 < argc) {
            grammar = argv[++i];
        }
        else if (strcmp(argv[i], "--trace") == 0) {
            trace = true;
        }
        else if (strcmp(argv[i], "--list") == 0) {
            for (const auto &entry : g) {
                out << entry.first << std::endl;
            }
            return 0;
        }
        else if (strcmp(argv[i], "--help") == 0) {
            usage(out);
            return 0;
        }
        else if (argv[i][0] == '-' || path != NULL) {
            usage(err);
            return 2;
        }
        else {
            path = argv[i];
        }
    }

    std::map<std::string, Parser>::const_iterator found = g.find(grammar);
    if (found == g.end()) {
        err << "recog: unknown grammar '" << grammar << "'" << std::endl;
        return 2;
    }
    Parser parser = found->second;
    if (trace) {
        parser = p_trace(grammar, parser, err);
    }

    FILE *input = stdin;
    std::unique_ptr<Text> text;
    if (path != NULL) {
        input = fopen(path, "rb");
        if (input == NULL) {
            err << "recog: cannot open " << path << ": " << strerror(errno) << std::endl;
            return 2;
        }
        try {
            text.reset(new FileText(input));
        }
        catch (const std::invalid_argument &) {
            /* A named pipe or similar: read it like stdin. */
            text.reset(new StreamText(input));
        }
    }
    else {
        text.reset(new StreamText(input));
    }

    int status = 1;
    try {
        Match result = recognize(parser, *text, text->start_cursor());
        out << "success? " << result.succeeded() << std::endl;
        if (result) {
            out << *result.value() << std::endl;
            status = 0;
        }
        else {
            out << result.kind() << std::endl;
        }
    }
    catch (const TextError &e) {
        err << "recog: " << e.what() << std::endl;
        status = 2;
    }

    if (path != NULL) {
        fclose(input);
    }
    return status;
}

}
