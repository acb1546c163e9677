#include "errors.hpp"

namespace recog {

const char *failure_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::EndOfText:
        return "EndOfText";
    case FailureKind::NoMatch:
        return "NoMatch";
    }
    return "Unknown";
}

std::ostream &operator<<(std::ostream &output, FailureKind kind) {
    output << failure_name(kind);
    return output;
}

void throw_failure(FailureKind kind) {
    if (kind == FailureKind::EndOfText) {
        throw EndOfTextError();
    }
    throw NoMatchError();
}

}
