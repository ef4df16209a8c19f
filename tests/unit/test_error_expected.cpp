#include <string>
#include <cstring>
#include <cassert>

#include "rtloop/core/error.hpp"
#include "rtloop/core/expected.hpp"

using namespace rtloop;

int main(){
    // taxonomy
    const Error rtv = Error::real_time_violation(1'000'000, 1'204'331);
    assert(rtv.is_real_time_violation());
    assert(!rtv.is_hardware_init_failed());
    assert(rtv.overshoot() == 204'331);
    assert(rtv.cycle_index == 0);
    assert(Error::real_time_violation(1'000'000, 1'204'331, 17).cycle_index == 17);
    assert(Error::hardware_init_failed("x").cycle_index == 0);

    const Error hw = Error::hardware_init_failed("mlockall: Operation not permitted");
    assert(hw.is_hardware_init_failed());
    assert(std::strcmp(hw.reason, "mlockall: Operation not permitted") == 0);
    assert(hw.overshoot() == 0);

    assert(Error::sensor_data_unavailable().is_sensor_data_unavailable());
    assert(Error::control_loop("diverged").is_control_loop_error());
    assert(Error::from_status(Status::kInvalidArg).code == Status::kInvalidArg);

    // reason truncated to the inline buffer, always terminated
    const std::string long_reason(200, 'x');
    const Error big = Error::control_loop(long_reason.c_str());
    assert(std::strlen(big.reason) == Error::kReasonCap - 1);
    assert(Error::control_loop(nullptr).reason[0] == '\0');

    // formatting
    char buf[128];
    std::size_t n = format_error(rtv, buf);
    assert(std::string(buf) == "RealTimeViolation: expected=1000000ns actual=1204331ns");
    assert(n == std::strlen(buf));

    n = format_error(hw, buf);
    assert(std::string(buf) == "HardwareInitFailed: mlockall: Operation not permitted");

    (void)format_error(Error::sensor_data_unavailable(), buf);
    assert(std::string(buf) == "SensorDataUnavailable");

    // truncation -> reports what landed in the buffer
    char tiny[8];
    n = format_error(rtv, tiny);
    assert(n == 7);
    assert(std::string(tiny) == "RealTim");

    assert(std::string(to_string(Status::kDeadlineMiss)) == "RealTimeViolation");
    assert(std::string(to_string(Status::kOK)) == "OK");

    // Expected
    auto ok = Expected<int>::success(5);
    assert(ok && ok.has_value() && ok.value() == 5 && ok.status() == Status::kOK);

    auto bad = Expected<int>::failure(rtv);
    assert(!bad && bad.status() == Status::kDeadlineMiss);
    assert(bad.error().actual == 1'204'331);

    auto bare = Expected<std::string>::failure(Status::kNotReady);
    assert(bare.status() == Status::kNotReady);

    // value semantics with a non trivial payload
    auto s = Expected<std::string>::emplace(3, 'a');
    auto copy = s;
    assert(copy.value() == "aaa" && s.value() == "aaa");
    auto moved = std::move(s);
    assert(moved.value() == "aaa");
    assert(!s.has_value());
    const std::string taken = moved.take();
    assert(taken == "aaa" && !moved.has_value());

    copy = bare;
    assert(!copy.has_value() && copy.status() == Status::kNotReady);

    // Outcome
    const Outcome o = Outcome::ok();
    assert(o && o.status() == Status::kOK);
    const Outcome f = Outcome::failure(hw);
    assert(!f && f.error().is_hardware_init_failed());
    return 0;
}
