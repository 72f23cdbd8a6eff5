#pragma once

#include <gmock/gmock.h>
#include "server/submission_store.hpp"

namespace grader::server::mock {

struct submission_store : public server::submission_store {
    MOCK_METHOD(void, update_status, (const std::string &sub_id, status st), (override));
    MOCK_METHOD(void, report_result, (const judge_result &result), (override));
};

}  // namespace grader::server::mock
