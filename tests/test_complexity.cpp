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

#include <gtest/gtest.h>

#include "relocator/complexity.hpp"

using namespace relocator;

namespace {

ComplexityInputs inputs(size_t files, size_t types, size_t refs, size_t projects) {
    ComplexityInputs in;
    in.affected_files = files;
    in.affected_types = types;
    in.required_project_references = refs;
    in.distinct_projects = projects;
    return in;
}

} // namespace

TEST(Complexity, SingleFileIsSimple) {
    EXPECT_EQ(score_complexity(inputs(1, 1, 0, 1)), Complexity::Simple);
    EXPECT_EQ(score_complexity(inputs(0, 0, 0, 0)), Complexity::Simple);
}

TEST(Complexity, BucketBoundaries) {
    EXPECT_EQ(complexity_score(inputs(5, 0, 0, 0)), 1);
    EXPECT_EQ(complexity_score(inputs(6, 0, 0, 0)), 2);
    EXPECT_EQ(complexity_score(inputs(20, 0, 0, 0)), 2);
    EXPECT_EQ(complexity_score(inputs(21, 0, 0, 0)), 3);
    EXPECT_EQ(complexity_score(inputs(0, 21, 0, 0)), 3);
    EXPECT_EQ(complexity_score(inputs(0, 0, 2, 0)), 1);
    EXPECT_EQ(complexity_score(inputs(0, 0, 3, 0)), 2);
    EXPECT_EQ(complexity_score(inputs(0, 0, 0, 3)), 1);
    EXPECT_EQ(complexity_score(inputs(0, 0, 0, 4)), 2);
}

TEST(Complexity, ScoreThresholds) {
    // 1 + 1 = 2
    EXPECT_EQ(score_complexity(inputs(2, 2, 0, 1)), Complexity::Medium);
    // 2 + 2 + 1 = 5
    EXPECT_EQ(score_complexity(inputs(10, 10, 1, 1)), Complexity::Complex);
    // 3 + 3 + 2 + 2 = 10
    EXPECT_EQ(score_complexity(inputs(50, 50, 5, 8)), Complexity::VeryComplex);
    // 3 + 3 + 1 = 7
    EXPECT_EQ(score_complexity(inputs(21, 21, 1, 1)), Complexity::Complex);
}

TEST(Complexity, ErrorsForceVeryComplex) {
    ComplexityInputs in = inputs(1, 1, 0, 1);
    in.has_errors = true;
    EXPECT_EQ(score_complexity(in), Complexity::VeryComplex);
}

TEST(Complexity, MonotonicInEveryInput) {
    const size_t samples[] = {0, 1, 2, 5, 6, 20, 21, 100};
    for (size_t a : samples) {
        for (size_t b : samples) {
            ComplexityInputs base = inputs(a, b, a / 4, b / 4);
            int score = static_cast<int>(score_complexity(base));

            ComplexityInputs more_files = base;
            more_files.affected_files += 7;
            EXPECT_GE(static_cast<int>(score_complexity(more_files)), score);

            ComplexityInputs more_types = base;
            more_types.affected_types += 7;
            EXPECT_GE(static_cast<int>(score_complexity(more_types)), score);

            ComplexityInputs more_refs = base;
            more_refs.required_project_references += 2;
            EXPECT_GE(static_cast<int>(score_complexity(more_refs)), score);

            ComplexityInputs more_projects = base;
            more_projects.distinct_projects += 2;
            EXPECT_GE(static_cast<int>(score_complexity(more_projects)), score);
        }
    }
}

TEST(Complexity, Names) {
    EXPECT_STREQ(complexity_to_string(Complexity::Simple), "Simple");
    EXPECT_STREQ(complexity_to_string(Complexity::VeryComplex), "VeryComplex");
}
