#include "trip_state/types.hpp"

namespace trip_state {

IClock &system_clock() {
  static SystemClock clock;
  return clock;
}

} // namespace trip_state
