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

#include "impact.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace relocator {

// Human readable report: summary table, errors, warnings, affected files
// grouped by reason (first-seen order) and required project references
std::string render_markdown(const ImpactReport &report);

// Machine readable report; absent optionals are null
json report_to_json(const ImpactReport &report);

} // namespace relocator
