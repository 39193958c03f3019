#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {

std::string RejectedChangeError::describe(const Rejection& r) {
    std::string message = r.message().empty() ? r.rule() : r.message();
    message += " [key=" + helpers::key_string(r.key()) +
               " type=" + helpers::change_type_name(r.change_type()) +
               " delta=" + std::to_string(r.attempted_delta()) +
               " current=" + std::to_string(r.current_quantity()) +
               " reserved=" + std::to_string(r.outstanding_reserved()) + "]";
    return message;
}

} // namespace stockledger
