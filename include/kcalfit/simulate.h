#ifndef KCALFIT_SIMULATE_H
#define KCALFIT_SIMULATE_H

#include <cstdint>

#include "kcalfit/journal.h"

namespace kcalfit {

// Synthetic 18-month bulk / mini-cut / bulk journey (60 kg -> ~75 kg) with
// sparse logging and quarterly body-fat readings. Same seed, same journal.
Journal simulateJourney(std::uint32_t seed);

}  // namespace kcalfit

#endif  // KCALFIT_SIMULATE_H
