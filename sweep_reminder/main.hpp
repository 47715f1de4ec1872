// Copyright 2026 Maree Carroll
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
#ifndef SWEEP_REMINDER_MAIN_HPP_
#define SWEEP_REMINDER_MAIN_HPP_

const char DEFAULT_RULES_PATH[] = "street_sweeping.csv";
const char DEFAULT_STATE_PATH[] = "sweep_state.json";
const char DEFAULT_LOCATION_ID[] = "default";

#endif  // SWEEP_REMINDER_MAIN_HPP_
