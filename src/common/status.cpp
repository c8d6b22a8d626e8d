#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace pysandbox {
using namespace std;

// clang-format off
static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::REJECTED, "Rejected")
    (outcome::COMPLETED, "Completed")
    (outcome::TIMED_OUT, "Timed Out")
    (outcome::RESOURCE_EXCEEDED, "Resource Exceeded")
    (outcome::RUNTIME_FAILURE, "Runtime Failure")
    (outcome::SANDBOX_ERROR, "Sandbox Error");

static const unordered_map<violation_kind, const char *> violation_string = boost::assign::map_list_of
    (violation_kind::FORBIDDEN_IMPORT, "Forbidden Import")
    (violation_kind::FORBIDDEN_CALL, "Forbidden Call")
    (violation_kind::FORBIDDEN_ATTRIBUTE_ACCESS, "Forbidden Attribute Access")
    (violation_kind::SYNTAX_ERROR, "Syntax Error");

static const unordered_map<submission_status, const char *> submission_string = boost::assign::map_list_of
    (submission_status::PASSED, "Passed")
    (submission_status::FAILED, "Failed")
    (submission_status::ERRORED, "Errored");
// clang-format on

const char *get_display_message(outcome stat) {
    return outcome_string.at(stat);
}

const char *get_display_message(violation_kind kind) {
    return violation_string.at(kind);
}

const char *get_display_message(submission_status stat) {
    return submission_string.at(stat);
}

}  // namespace pysandbox
