#include "result.hpp"

#include <sstream>

namespace recog {

std::ostream &ListResult::print(std::ostream &output) const {
    output << "[";
    for (size_t i = 0; i < result.size(); i++) {
        if (i > 0) {
            output << ", ";
        }
        output << *result[i];
    }
    output << "]";
    return output;
}

template<>
bool StringResult::is_empty() const {
    return result == "";
}

ResultPtr empty_result() {
    static const ResultPtr empty = std::make_shared<EmptyResult>();
    return empty;
}

ResultPtr make_char(char c) {
    return std::make_shared<CharResult>(c);
}

ResultPtr make_string(const std::string &s) {
    return std::make_shared<StringResult>(s);
}

ResultPtr make_int(long long n) {
    return std::make_shared<IntResult>(n);
}

ResultPtr make_list(const std::vector<ResultPtr> &ls) {
    return std::make_shared<ListResult>(ls);
}

const ListResult &as_list(const ResultPtr &r) {
    return dynamic_cast<const ListResult &>(*r);
}

ResultPtr cons(const ResultPtr &head, const ResultPtr &tail) {
    const std::vector<ResultPtr> &rest = as_list(tail).get_result();
    std::vector<ResultPtr> ls;
    ls.reserve(rest.size() + 1);
    ls.push_back(head);
    ls.insert(ls.end(), rest.begin(), rest.end());
    return make_list(ls);
}

static void concat_into(const ResultPtr &r, std::string &acc) {
    if (r->is_empty()) {
        return;
    }
    const ListResult *lr = dynamic_cast<const ListResult *>(r.get());
    if (lr == NULL) {
        std::ostringstream out;
        r->print(out);
        acc += out.str();
        return;
    }
    for (const auto &el : lr->get_result()) {
        concat_into(el, acc);
    }
}

std::string concat(const ResultPtr &r) {
    std::string acc;
    concat_into(r, acc);
    return acc;
}

std::string to_string(const ResultPtr &r) {
    std::ostringstream out;
    r->print(out);
    return out.str();
}

}
