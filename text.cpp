#include "text.hpp"

#include <stdexcept>

namespace recog {

Cursor StringText::start_cursor() const {
    return Cursor(0);
}

bool StringText::read(const Cursor &cursor, char &element, Cursor &next) const {
    size_t idx = cursor.index();
    if (idx >= s.length()) {
        return false;
    }
    element = s[idx];
    next = cursor.advanced();
    return true;
}

FileText::FileText(FILE *input) : input(input), origin(0) {
    if (input == NULL) {
        throw std::invalid_argument("FileText: null file");
    }
    origin = ftell(input);
    if (origin < 0) {
        throw std::invalid_argument("FileText: file is not seekable");
    }
}

Cursor FileText::start_cursor() const {
    return Cursor(0);
}

bool FileText::read(const Cursor &cursor, char &element, Cursor &next) const {
    long offset = origin + (long)cursor.index();
    if (fseek(input, offset, SEEK_SET) != 0) {
        throw TextError("FileText: seek failed");
    }
    int c = fgetc(input);
    if (c == EOF) {
        if (ferror(input)) {
            clearerr(input);
            throw TextError("FileText: read failed");
        }
        return false;
    }
    element = (char)c;
    next = cursor.advanced();
    return true;
}

StreamText::StreamText(FILE *input) : input(input), exhausted(false) {
    if (input == NULL) {
        throw std::invalid_argument("StreamText: null file");
    }
}

Cursor StreamText::start_cursor() const {
    return Cursor(0);
}

bool StreamText::fill_to(size_t index) const {
    while (buffer.size() <= index && !exhausted) {
        int c = fgetc(input);
        if (c == EOF) {
            if (ferror(input)) {
                clearerr(input);
                throw TextError("StreamText: read failed");
            }
            exhausted = true;
        }
        else {
            buffer += (char)c;
        }
    }
    return index < buffer.size();
}

bool StreamText::read(const Cursor &cursor, char &element, Cursor &next) const {
    if (!fill_to(cursor.index())) {
        return false;
    }
    element = buffer[cursor.index()];
    next = cursor.advanced();
    return true;
}

}
