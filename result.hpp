#ifndef RECOG_RESULT_HPP
#define RECOG_RESULT_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace recog {

/* Result < Atom
   Atom < String
   Atom < Char
   Atom < Int
   Result < List<Result>
   Result < Empty
   */

class ParseResult {
public:
    virtual ~ParseResult() {}

    friend std::ostream &operator<<(std::ostream &output, const ParseResult &result) {
        return result.print(output);
    }

    virtual bool is_empty() const = 0;
    virtual std::ostream &print(std::ostream &output) const = 0;
};

/* Results are immutable once built, so sharing them is safe. */
typedef std::shared_ptr<const ParseResult> ResultPtr;

/* What epsilon and the end marker produce. */
class EmptyResult : public ParseResult {
public:
    bool is_empty() const {
        return true;
    }

    std::ostream &print(std::ostream &output) const {
        output << "<empty>";
        return output;
    }
};

class ListResult : public ParseResult {
public:
    ListResult() {}
    ListResult(std::initializer_list<ResultPtr> ls) : result(ls) {}
    explicit ListResult(const std::vector<ResultPtr> &ls) : result(ls) {}

    bool is_empty() const {
        return result.size() == 0;
    }

    const std::vector<ResultPtr> &get_result() const {
        return result;
    }

    size_t size() const {
        return result.size();
    }

    const ResultPtr &at(size_t i) const {
        return result.at(i);
    }

    std::ostream &print(std::ostream &output) const;

private:
    std::vector<ResultPtr> result;
};

template<typename T>
class Result : public ParseResult {
public:
    explicit Result(const T &t) : result(t) {}

    bool is_empty() const;

    const T &get() const {
        return result;
    }

    std::ostream &print(std::ostream &output) const {
        output << result;
        return output;
    }

private:
    T result;
};

typedef Result<char> CharResult;
typedef Result<std::string> StringResult;
typedef Result<long long> IntResult;

template<typename T>
bool Result<T>::is_empty() const {
    return false;
}

template<>
bool StringResult::is_empty() const;

ResultPtr empty_result();
ResultPtr make_char(char c);
ResultPtr make_string(const std::string &s);
ResultPtr make_int(long long n);
ResultPtr make_list(const std::vector<ResultPtr> &ls);

/* Typed access. A result of another type throws std::bad_cast. */
template<typename T>
const T &value_of(const ResultPtr &r) {
    return dynamic_cast<const Result<T> &>(*r).get();
}

const ListResult &as_list(const ResultPtr &r);

/* A new list with head in front of the elements of tail. */
ResultPtr cons(const ResultPtr &head, const ResultPtr &tail);

/* Flattens nested lists of chars and strings into one string. Empty
   results contribute nothing; other atoms contribute their printed form. */
std::string concat(const ResultPtr &r);

std::string to_string(const ResultPtr &r);

}

#endif
