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

#include "relocator/complexity.hpp"

namespace relocator {

namespace {

int count_bucket(size_t count) {
    if (count <= 1)
        return 0;
    if (count <= 5)
        return 1;
    if (count <= 20)
        return 2;
    return 3;
}

int reference_bucket(size_t count) {
    if (count == 0)
        return 0;
    if (count <= 2)
        return 1;
    return 2;
}

int project_bucket(size_t count) {
    if (count <= 1)
        return 0;
    if (count <= 3)
        return 1;
    return 2;
}

} // namespace

const char *complexity_to_string(Complexity complexity) {
    switch (complexity) {
    case Complexity::Simple:
        return "Simple";
    case Complexity::Medium:
        return "Medium";
    case Complexity::Complex:
        return "Complex";
    case Complexity::VeryComplex:
        return "VeryComplex";
    }
    return "Simple";
}

int complexity_score(const ComplexityInputs &inputs) {
    return count_bucket(inputs.affected_files) + count_bucket(inputs.affected_types) +
           reference_bucket(inputs.required_project_references) +
           project_bucket(inputs.distinct_projects);
}

Complexity score_complexity(const ComplexityInputs &inputs) {
    if (inputs.has_errors)
        return Complexity::VeryComplex;

    int score = complexity_score(inputs);
    if (score <= 1)
        return Complexity::Simple;
    if (score <= 4)
        return Complexity::Medium;
    if (score <= 7)
        return Complexity::Complex;
    return Complexity::VeryComplex;
}

} // namespace relocator
