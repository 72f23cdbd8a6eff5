#include "server/problem_store.hpp"
#include "server/submission_store.hpp"

namespace grader::server {

submission_store::~submission_store() {}

problem_store::~problem_store() {}

}  // namespace grader::server
