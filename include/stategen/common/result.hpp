#pragma once

#include <stategen/schema/state_error.hpp>

#include <boost/outcome/policy/terminate.hpp>
#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>

namespace stategen::common {

namespace outcome = boost::outcome_v2;

/// Value or `state_error`. Observing the wrong alternative terminates.
template <typename T>
using result = outcome::std_result<T, stategen::schema::state_error,
                                   outcome::policy::terminate>;

inline auto success() {
  return outcome::success();
}

}  // namespace stategen::common
