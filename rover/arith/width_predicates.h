// Copyright 2026 The Rover Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef ROVER_ARITH_WIDTH_PREDICATES_H_
#define ROVER_ARITH_WIDTH_PREDICATES_H_

#include <optional>

#include "rover/arith/width.h"

namespace rover {

// Overflow predicates. Each returns true iff an output of `output_width` bits
// holds every result of the operation on operands of the given widths, i.e.
// the operation can never wrap around. They are used as rewrite guards only;
// all arithmetic is carried out in 64 bits so the predicates are total.

// output_width >= max(width_a, width_b) + 1
bool AddNoOverflow(WidthInt output_width, WidthInt width_a, WidthInt width_b);

// output_width >= width_a + width_b
bool MulNoOverflow(WidthInt output_width, WidthInt width_a, WidthInt width_b);

// output_width >= value_width + (2^amount_width - 1), the value shifted by the
// largest amount representable in `amount_width` bits.
bool ShiftNoOverflow(WidthInt output_width, WidthInt value_width,
                     WidthInt amount_width);

// Width formulas used by the `max+1` and `wlsh` operators of derived
// right-hand sides. Both return std::nullopt when the result is not
// representable as a WidthInt.

// max(width_a, width_b) + 1: the output width of an overflow-free sum.
std::optional<WidthInt> MaxPlus1Width(WidthInt width_a, WidthInt width_b);

// value_width + (2^amount_width - 1): the output width of an overflow-free
// left shift.
std::optional<WidthInt> LeftShiftWidth(WidthInt value_width,
                                       WidthInt amount_width);

}  // namespace rover

#endif  // ROVER_ARITH_WIDTH_PREDICATES_H_
