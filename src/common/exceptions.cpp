#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arena {
using namespace std;

arena_exception::arena_exception()
    : arena_exception("") {}

arena_exception::arena_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *arena_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const arena_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error()
    : arena_exception() {}

validation_error::validation_error(const string &message)
    : arena_exception(message) {}

not_found_error::not_found_error()
    : arena_exception() {}

not_found_error::not_found_error(const string &message)
    : arena_exception(message) {}

forbidden_error::forbidden_error()
    : arena_exception() {}

forbidden_error::forbidden_error(const string &message)
    : arena_exception(message) {}

conflict_error::conflict_error()
    : arena_exception() {}

conflict_error::conflict_error(const string &message)
    : arena_exception(message) {}

provisioning_error::provisioning_error()
    : arena_exception() {}

provisioning_error::provisioning_error(const string &message)
    : arena_exception(message) {}

docker_error::docker_error()
    : arena_exception() {}

docker_error::docker_error(const string &message)
    : arena_exception(message) {}

database_error::database_error()
    : arena_exception() {}

database_error::database_error(const string &message)
    : arena_exception(message) {}

evaluation_error::evaluation_error()
    : arena_exception() {}

evaluation_error::evaluation_error(const string &message)
    : arena_exception(message) {}

evaluation_timeout::evaluation_timeout(const string &message)
    : evaluation_error(message) {}

}  // namespace arena
