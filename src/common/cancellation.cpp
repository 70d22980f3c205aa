#include "common/cancellation.hpp"
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

cancellation_token::cancellation_token() : flag(false) {}

cancellation_token::cancellation_token(chrono::steady_clock::time_point deadline)
    : flag(false), deadline(deadline) {}

void cancellation_token::cancel() {
    flag = true;
}

bool cancellation_token::cancelled() const {
    if (flag) return true;
    return deadline && chrono::steady_clock::now() >= *deadline;
}

void cancellation_token::throw_if_cancelled() const {
    if (cancelled()) throw cancelled_error();
}

}  // namespace grader
