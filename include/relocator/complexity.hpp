// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>

namespace relocator {

enum class Complexity { Simple, Medium, Complex, VeryComplex };

const char *complexity_to_string(Complexity complexity);

// Counts taken from a finished impact report
struct ComplexityInputs {
    size_t affected_files = 0;
    size_t affected_types = 0;
    size_t required_project_references = 0;
    size_t distinct_projects = 0;
    bool has_errors = false;
};

// Bucket score per count, summed:
//   files, types:      <=1 -> 0, <=5 -> 1, <=20 -> 2, else 3
//   project refs:      0 -> 0,  <=2 -> 1, else 2
//   distinct projects: <=1 -> 0, <=3 -> 1, else 2
// Total <=1 Simple, <=4 Medium, <=7 Complex, else VeryComplex.
// Any error makes the result VeryComplex.
int complexity_score(const ComplexityInputs &inputs);
Complexity score_complexity(const ComplexityInputs &inputs);

} // namespace relocator
