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

#ifndef ROVER_COMMON_INIT_ROVER_H_
#define ROVER_COMMON_INIT_ROVER_H_

#include <string_view>
#include <vector>

namespace rover {

// Initializes global state in the binary: parses command line flags and sets
// up logging. This function might exit the program, for example if the
// command line flags are invalid or if a '--help' command line argument was
// provided.
//
// `usage` provides a short usage message passed to
// absl::SetProgramUsageMessage().
//
// Returns the positional arguments that are not part of any command-line
// flag, not including the program invocation name.
std::vector<std::string_view> InitRover(std::string_view usage, int argc,
                                        char* argv[]);

}  // namespace rover

#endif  // ROVER_COMMON_INIT_ROVER_H_
