#ifndef RECOG_TEXT_HPP
#define RECOG_TEXT_HPP

#include <iostream>
#include <string>
#include <vector>

#include <stdio.h>

#include "errors.hpp"

namespace recog {

/* A position in a Text. Cursors are plain values: keeping an old one
   around and reading from it again is how backtracking works. */
class Cursor {
public:
    Cursor() : position(0) {}
    explicit Cursor(size_t position) : position(position) {}

    size_t index() const {
        return position;
    }

    Cursor advanced() const {
        return Cursor(position + 1);
    }

    bool operator==(const Cursor &other) const {
        return position == other.position;
    }

    bool operator!=(const Cursor &other) const {
        return position != other.position;
    }

    friend std::ostream &operator<<(std::ostream &output, const Cursor &cursor) {
        output << "@" << cursor.position;
        return output;
    }

private:
    size_t position;
};

/* The base class of text inputs. */
class Text {
public:
    virtual ~Text() {}

    /* Cursor that reads the first element. */
    virtual Cursor start_cursor() const = 0;

    /* Stores the element at cursor and the cursor after it. Returns
       false, leaving both untouched, if the text is exhausted there.
       Reading twice at the same cursor gives the same answer. Sources
       backed by a file throw TextError when the file fails. */
    virtual bool read(const Cursor &cursor, char &element, Cursor &next) const = 0;
};

class StringText : public Text {
public:
    explicit StringText(const std::string &s) : s(s) {}

    Cursor start_cursor() const;
    bool read(const Cursor &cursor, char &element, Cursor &next) const;

    const std::string &str() const {
        return s;
    }

private:
    std::string s;
};

/* Seeks a regular file for every read. The file is borrowed, not closed. */
class FileText : public Text {
public:
    explicit FileText(FILE *input);

    Cursor start_cursor() const;
    bool read(const Cursor &cursor, char &element, Cursor &next) const;

private:
    FILE *input;
    long origin;
};

/* For pipes and terminals. Elements are pulled from the stream only when a
   cursor past the buffered prefix is read, and kept so that earlier
   cursors stay readable. Not safe to share between threads. */
class StreamText : public Text {
public:
    explicit StreamText(FILE *input);

    Cursor start_cursor() const;
    bool read(const Cursor &cursor, char &element, Cursor &next) const;

    size_t buffered() const {
        return buffer.size();
    }

private:
    bool fill_to(size_t index) const;

    FILE *input;
    mutable std::string buffer;
    mutable bool exhausted;
};

}

#endif
